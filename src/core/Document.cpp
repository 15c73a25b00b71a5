#include "Document.hpp"

#include <utility>

namespace philoglot::core
{

Doc Doc::fromTokens(std::string raw_text, const std::vector<std::string>& tokens, std::string language_code)
{
    Doc doc;
    doc.raw = std::move(raw_text);
    doc.language = std::move(language_code);
    doc.words.reserve(tokens.size());
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        Word word;
        word.string = tokens[i];
        word.index_token = i;
        doc.words.push_back(std::move(word));
    }
    return doc;
}

std::vector<std::string> Doc::tokens() const
{
    std::vector<std::string> out;
    out.reserve(words.size());
    for (const auto& word : words)
        out.push_back(word.string);
    return out;
}

std::vector<std::string> split_on_spaces(const std::string& text)
{
    std::vector<std::string> out;
    std::string current;
    for (char c : text)
    {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t')
        {
            if (!current.empty())
            {
                out.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty())
        out.push_back(std::move(current));
    return out;
}

} // namespace philoglot::core
