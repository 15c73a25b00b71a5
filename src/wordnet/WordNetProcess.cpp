#include "WordNetProcess.hpp"

#include <plog/Log.h>

#include <utility>

namespace philoglot::wordnet
{

namespace
{

core::CachedResolver<IWordNetReader>::Factory makeResolver(const std::string& language, ReaderFactory factory)
{
    if (!factory)
    {
        factory = [](const std::string& code) -> std::unique_ptr<IWordNetReader>
        {
            return std::make_unique<WordNetCorpusReader>(code);
        };
    }

    return [language, factory = std::move(factory)]() -> std::unique_ptr<IWordNetReader>
    {
        auto code = wordnetCodeFor(language);
        if (!code)
        {
            PLOG_DEBUG << "[WordNetProcess] no WordNet for language=" << language;
            return nullptr;
        }
        return factory(*code);
    };
}

} // namespace

WordNetProcess::WordNetProcess(std::string language, core::Doc* input_doc, ReaderFactory factory)
    : core::Process(input_doc)
    , language_(std::move(language))
    , description_("WordNet lookups for " + language_ + ".")
    , algorithm_(makeResolver(language_, std::move(factory)))
{
}

WordNetProcess::~WordNetProcess() = default;

IWordNetReader* WordNetProcess::algorithm()
{
    return algorithm_.get();
}

void WordNetProcess::run()
{
    core::Doc& doc = requireInputDoc();
    // Extension point: resolve each word's lemma to its synsets here.
    setOutputDoc(&doc);
}

} // namespace philoglot::wordnet
