#include "content_scorer.h"

#include <iostream>

#include "html_serializer.h"
#include "text_normalizer.h"
#include "utils.h"

using namespace std;

static const char* c_section_name = "contentScorer";

static const char* _content_keywords[] = {"article", "content", "entry", "hentry", "main", "page",
    "pagination", "post", "text", "blog", "story", "body", "section", "readable"};
static const char* _non_content_keywords[] = {"combx", "comment", "com-", "contact", "foot", "footer",
    "footnote", "masthead", "media", "meta", "outbrain", "promo", "related", "scroll", "shoutbox",
    "sidebar", "sponsor", "shopping", "tags", "tool", "widget", "nav", "menu", "header", "ad",
    "advertisement", "banner", "social", "share", "sharing", "login", "signup"};
static const char* _tag_bonus_names[] = {"article", "section", "div", "main", "p", "pre", "td",
    "blockquote", "address", "ol", "ul", "dl", "dd", "dt", "li", "form", "aside", "footer", "header", "nav"};
static const double _tag_bonus_values[] = {10, 10, 10, 10, 5, 5, 5,
    3, 3, 3, 3, 3, 3, 3, 3, -10, -10, -10, -10, -10};
static const char* _heading_tags[] = {"h1", "h2", "h3", "h4", "h5", "h6"};

static const vector<string> c_heading_tags(_heading_tags, _heading_tags + sizeof(_heading_tags) / sizeof(_heading_tags[0]));

static const char* c_feature_names[] =
{
#define CONTENT_SCORER_FEATURE(f) #f,
#include "content_scorer_features.h"
#undef CONTENT_SCORER_FEATURE
};

ScoringWeights::ScoringWeights() :
    text_density(50.0),
    paragraph_density(20.0),
    sentence_density(15.0),
    word_density(15.0),
    id_boost(5.0),
    class_boost(3.0),
    non_content_factor(0.5),
    heading_density(10.0),
    list_density(5.0),
    image_density(3.0),
    child_paragraph(5.0),
    captioned_figure(10.0),
    content_keywords(_content_keywords, _content_keywords + sizeof(_content_keywords) / sizeof(_content_keywords[0])),
    non_content_keywords(_non_content_keywords, _non_content_keywords + sizeof(_non_content_keywords) / sizeof(_non_content_keywords[0])),
    tag_bonus_names(_tag_bonus_names, _tag_bonus_names + sizeof(_tag_bonus_names) / sizeof(_tag_bonus_names[0])),
    tag_bonus_values(_tag_bonus_values, _tag_bonus_values + sizeof(_tag_bonus_values) / sizeof(_tag_bonus_values[0]))
{
}

ContentScorer::ContentScorer()
{
}

bool ContentScorer::init(const Config& config)
{
    ScoringWeights& weights = this->_weights;
    weights.text_density = config.GetDoubleValue(c_section_name, "text_density_weight", weights.text_density);
    weights.paragraph_density = config.GetDoubleValue(c_section_name, "paragraph_density_weight", weights.paragraph_density);
    weights.sentence_density = config.GetDoubleValue(c_section_name, "sentence_density_weight", weights.sentence_density);
    weights.word_density = config.GetDoubleValue(c_section_name, "word_density_weight", weights.word_density);
    weights.id_boost = config.GetDoubleValue(c_section_name, "id_boost", weights.id_boost);
    weights.class_boost = config.GetDoubleValue(c_section_name, "class_boost", weights.class_boost);
    weights.non_content_factor = config.GetDoubleValue(c_section_name, "non_content_factor", weights.non_content_factor);
    weights.heading_density = config.GetDoubleValue(c_section_name, "heading_density_weight", weights.heading_density);
    weights.list_density = config.GetDoubleValue(c_section_name, "list_density_weight", weights.list_density);
    weights.image_density = config.GetDoubleValue(c_section_name, "image_density_weight", weights.image_density);
    weights.child_paragraph = config.GetDoubleValue(c_section_name, "child_paragraph_weight", weights.child_paragraph);
    weights.captioned_figure = config.GetDoubleValue(c_section_name, "captioned_figure_weight", weights.captioned_figure);

    if (config.HasKey(c_section_name, "content_keywords"))
    {
        weights.content_keywords = config.GetStringList(c_section_name, "content_keywords");
    }

    if (config.HasKey(c_section_name, "non_content_keywords"))
    {
        weights.non_content_keywords = config.GetStringList(c_section_name, "non_content_keywords");
    }

    if (config.HasKey(c_section_name, "tag_bonus_names") || config.HasKey(c_section_name, "tag_bonus_values"))
    {
        const vector<string>& names = config.GetStringList(c_section_name, "tag_bonus_names");
        const vector<double>& values = config.GetDoubleList(c_section_name, "tag_bonus_values");
        if (names.size() != values.size())
        {
            cerr << "tag bonus name/values should be in pairs" << endl;
            return false;
        }

        weights.tag_bonus_names = names;
        weights.tag_bonus_values = values;
    }

    return true;
}

const char* ContentScorer::feature_name(int feature)
{
    if (feature < 0 || feature >= FN_TOTAL_FEATURE_COUNT)
    {
        return "";
    }

    return c_feature_names[feature];
}

bool ContentScorer::matches_keywords(const char* value, const vector<string>& keywords) const
{
    if (value == NULL)
    {
        return false;
    }

    return match_list(to_lower(value).c_str(), keywords, 2) != -1;
}

double ContentScorer::content_boost(const DomNode& node) const
{
    const char* id = node.get_attribute("id");
    const char* klass = node.get_attribute("class");

    double boost = 1.0;
    if (this->matches_keywords(id, this->_weights.content_keywords))
    {
        boost += this->_weights.id_boost;
    }

    if (this->matches_keywords(klass, this->_weights.content_keywords))
    {
        boost += this->_weights.class_boost;
    }

    if (this->matches_keywords(id, this->_weights.non_content_keywords) || this->matches_keywords(klass, this->_weights.non_content_keywords))
    {
        boost *= this->_weights.non_content_factor;
    }

    return boost;
}

double ContentScorer::tag_bonus(const string& tag) const
{
    int index = match_list(tag.c_str(), this->_weights.tag_bonus_names, 1);
    if (index == -1)
    {
        return 0.0;
    }

    return this->_weights.tag_bonus_values[index];
}

// matching descendants, node itself excluded
static void find_descendants(const DomTree& tree, NodeId node, const char* tag_name, vector<NodeId>& results)
{
    const vector<NodeId>& children = tree.get_node(node).get_children();
    for (size_t i = 0; i < children.size(); ++i)
    {
        tree.find_tags(children[i], tag_name, results);
    }
}

void ContentScorer::extract_features(const DomTree& tree, NodeId node, vector<double>& features) const
{
    features.assign(FN_TOTAL_FEATURE_COUNT, 0.0);
    const DomNode& element = tree.get_node(node);

    string text = tree.text(node);
    features[FN_TEXT_LENGTH] = text.length();
    features[FN_HTML_LENGTH] = outer_html(tree, node).length();

    vector<NodeId> anchors;
    find_descendants(tree, node, "a", anchors);
    size_t link_length = 0;
    for (size_t i = 0; i < anchors.size(); ++i)
    {
        link_length += tree.text(anchors[i]).length();
    }

    features[FN_LINK_TEXT_LENGTH] = link_length;

    vector<NodeId> paragraphs;
    find_descendants(tree, node, "p", paragraphs);
    features[FN_PARAGRAPH_COUNT] = paragraphs.size();
    features[FN_SENTENCE_COUNT] = count_sentences(text);
    features[FN_WORD_COUNT] = count_words(text);

    vector<NodeId> headings;
    const vector<NodeId>& children = element.get_children();
    for (size_t i = 0; i < children.size(); ++i)
    {
        tree.find_tags(children[i], c_heading_tags, headings);
    }

    features[FN_HEADING_COUNT] = headings.size();

    vector<NodeId> items;
    find_descendants(tree, node, "li", items);
    features[FN_LIST_ITEM_COUNT] = items.size();

    vector<NodeId> images;
    find_descendants(tree, node, "img", images);
    features[FN_IMAGE_COUNT] = images.size();

    int child_paragraphs = 0;
    for (size_t i = 0; i < children.size(); ++i)
    {
        if (tree.is_element(children[i], "p"))
        {
            ++child_paragraphs;
        }
    }

    features[FN_CHILD_PARAGRAPH_COUNT] = child_paragraphs;

    vector<NodeId> figures;
    find_descendants(tree, node, "figure", figures);
    int captioned = 0;
    for (size_t i = 0; i < figures.size(); ++i)
    {
        if (tree.count_tags(figures[i], "figcaption") > 0 && tree.count_tags(figures[i], "img") > 0)
        {
            ++captioned;
        }
    }

    features[FN_CAPTIONED_FIGURE_COUNT] = captioned;
    features[FN_CONTENT_BOOST] = element.is_element() ? this->content_boost(element) : 1.0;
    features[FN_TAG_BONUS] = element.is_element() ? this->tag_bonus(element.get_tag()) : 0.0;
}

static double ratio(double numerator, double denominator, double scale)
{
    if (denominator <= 0.0)
    {
        return 0.0;
    }

    return numerator / denominator * scale;
}

double ContentScorer::density_from_features(const vector<double>& features) const
{
    double text_length = features[FN_TEXT_LENGTH];
    double text_density = ratio(text_length, features[FN_HTML_LENGTH], 1.0);
    double paragraph_density = ratio(features[FN_PARAGRAPH_COUNT], text_length, 1000.0);
    double sentence_density = ratio(features[FN_SENTENCE_COUNT], text_length, 1000.0);
    double word_density = ratio(features[FN_WORD_COUNT], text_length, 100.0);

    const ScoringWeights& w = this->_weights;
    return (text_density * w.text_density + paragraph_density * w.paragraph_density
        + sentence_density * w.sentence_density + word_density * w.word_density) * features[FN_CONTENT_BOOST];
}

double ContentScorer::score_features(const vector<double>& features) const
{
    double text_length = features[FN_TEXT_LENGTH];
    const ScoringWeights& w = this->_weights;

    double link_density_score = 0.0;
    if (text_length > 0.0)
    {
        link_density_score = 1.0 - features[FN_LINK_TEXT_LENGTH] / text_length;
    }

    double score = this->density_from_features(features) * link_density_score;
    score += ratio(features[FN_HEADING_COUNT], text_length, 1000.0) * w.heading_density;
    score += ratio(features[FN_LIST_ITEM_COUNT], text_length, 1000.0) * w.list_density;
    score += ratio(features[FN_IMAGE_COUNT], features[FN_HTML_LENGTH], 1000.0) * w.image_density;
    score += features[FN_TAG_BONUS];
    score += features[FN_CHILD_PARAGRAPH_COUNT] * w.child_paragraph;
    score += features[FN_CAPTIONED_FIGURE_COUNT] * w.captioned_figure;
    return score;
}

double ContentScorer::score(const DomTree& tree, NodeId node) const
{
    vector<double> features;
    this->extract_features(tree, node, features);
    return this->score_features(features);
}

double ContentScorer::content_density(const DomTree& tree, NodeId node) const
{
    vector<double> features;
    this->extract_features(tree, node, features);
    return this->density_from_features(features);
}

double ContentScorer::link_density(const DomTree& tree, NodeId node) const
{
    string text = tree.text(node);
    if (text.empty())
    {
        return 0.0;
    }

    vector<NodeId> anchors;
    find_descendants(tree, node, "a", anchors);
    size_t link_length = 0;
    for (size_t i = 0; i < anchors.size(); ++i)
    {
        link_length += tree.text(anchors[i]).length();
    }

    return static_cast<double>(link_length) / text.length();
}
