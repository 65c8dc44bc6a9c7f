CONTENT_SCORER_FEATURE(FN_TEXT_LENGTH)
CONTENT_SCORER_FEATURE(FN_HTML_LENGTH)
CONTENT_SCORER_FEATURE(FN_LINK_TEXT_LENGTH)
CONTENT_SCORER_FEATURE(FN_PARAGRAPH_COUNT)
CONTENT_SCORER_FEATURE(FN_SENTENCE_COUNT)
CONTENT_SCORER_FEATURE(FN_WORD_COUNT)
CONTENT_SCORER_FEATURE(FN_HEADING_COUNT)
CONTENT_SCORER_FEATURE(FN_LIST_ITEM_COUNT)
CONTENT_SCORER_FEATURE(FN_IMAGE_COUNT)
CONTENT_SCORER_FEATURE(FN_CHILD_PARAGRAPH_COUNT)
CONTENT_SCORER_FEATURE(FN_CAPTIONED_FIGURE_COUNT)
CONTENT_SCORER_FEATURE(FN_CONTENT_BOOST)
CONTENT_SCORER_FEATURE(FN_TAG_BONUS)
