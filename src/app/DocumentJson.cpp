#include "DocumentJson.hpp"

using json = nlohmann::json;

namespace philoglot::app
{

json toJson(const core::Doc& doc)
{
    json words = json::array();
    for (const auto& word : doc.words)
    {
        json entry;
        entry["index"] = word.index_token;
        entry["string"] = word.string;
        entry["lemma"] = word.lemma ? json(*word.lemma) : json(nullptr);
        entry["embedding"] = word.embedding ? json(*word.embedding) : json(nullptr);
        words.push_back(std::move(entry));
    }

    json out;
    out["raw"] = doc.raw;
    out["language"] = doc.language;
    out["words"] = std::move(words);
    return out;
}

} // namespace philoglot::app
