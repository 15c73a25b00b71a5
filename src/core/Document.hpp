#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace philoglot::core
{

// A token record. Identity is its position inside Doc::words.
struct Word
{
    std::string string;                          // Token text as produced by the tokenizer
    std::size_t index_token = 0;                 // Position within the document
    std::optional<std::string> lemma;            // Filled by lemmatizers, read by sense lookup
    std::optional<std::vector<float>> embedding; // Unset until an embeddings process runs
};

struct Doc
{
    std::string raw;
    std::string language;
    std::vector<Word> words;

    // Builds a document from already-tokenized strings, numbering the tokens in order.
    static Doc fromTokens(std::string raw_text, const std::vector<std::string>& tokens,
                          std::string language_code = "");

    [[nodiscard]] std::vector<std::string> tokens() const;
};

// Splits on single spaces, keeping empty tokens out. This is not a tokenizer;
// it mirrors how example texts are fed to the pipeline.
[[nodiscard]] std::vector<std::string> split_on_spaces(const std::string& text);

} // namespace philoglot::core
