#ifndef _CONTENT_SCORER_H_
#define _CONTENT_SCORER_H_

#include <string>
#include <vector>

#include "config.h"
#include "dom_tree.h"

struct ScoringWeights
{
    ScoringWeights();

    double text_density;
    double paragraph_density;
    double sentence_density;
    double word_density;

    double id_boost;
    double class_boost;
    double non_content_factor;

    double heading_density;
    double list_density;
    double image_density;
    double child_paragraph;
    double captioned_figure;

    // substrings matched against the lower cased id and class
    std::vector<std::string> content_keywords;
    std::vector<std::string> non_content_keywords;

    // tag_bonus_names[i] scores tag_bonus_values[i]
    std::vector<std::string> tag_bonus_names;
    std::vector<double> tag_bonus_values;
};

// Scores a subtree by how much it looks like article content. Pure function
// of the subtree, safe to call from several threads on one const tree.
class ContentScorer
{
public:
    enum FeatureNames
    {
        #define CONTENT_SCORER_FEATURE(f) f,
        #include "content_scorer_features.h"
        #undef CONTENT_SCORER_FEATURE

        FN_TOTAL_FEATURE_COUNT,
    };

    ContentScorer();

    // reads the [contentScorer] section, missing keys keep their defaults
    bool init(const Config& config);

    double score(const DomTree& tree, NodeId node) const;

    // (text*w + paragraph*w + sentence*w + word*w) * content boost
    double content_density(const DomTree& tree, NodeId node) const;

    // anchor text length / text length, 0 for empty text
    double link_density(const DomTree& tree, NodeId node) const;

    void extract_features(const DomTree& tree, NodeId node, std::vector<double>& features) const;
    double score_features(const std::vector<double>& features) const;
    double density_from_features(const std::vector<double>& features) const;

    double content_boost(const DomNode& node) const;
    double tag_bonus(const std::string& tag) const;

    const ScoringWeights& get_weights() const
    {
        return this->_weights;
    }

    static const char* feature_name(int feature);

private:
    bool matches_keywords(const char* value, const std::vector<std::string>& keywords) const;

    ScoringWeights _weights;
};

#endif
