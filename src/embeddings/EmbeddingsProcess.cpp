#include "EmbeddingsProcess.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <optional>
#include <utility>

namespace philoglot::embeddings
{

namespace
{

core::CachedResolver<IEmbeddingBackend>::Factory makeResolver(const EmbeddingsConfig& config, BackendFactory factory)
{
    if (!factory)
        factory = &createEmbeddingBackend;

    // Captures copies so a moved process keeps a valid factory.
    return [language = config.language, variant_name = config.variant,
            factory = std::move(factory)]() -> std::unique_ptr<IEmbeddingBackend>
    {
        const EmbeddingVariant variant = parseVariant(variant_name);
        auto backend = factory(variant, language);
        if (!backend)
        {
            throw BackendError("no " + std::string(variantName(variant)) + " backend available for language '" +
                               language + "'");
        }
        PLOG_INFO << "[EmbeddingsProcess] resolved backend=" << backend->name() << " language=" << language
                  << " dims=" << backend->vectorLength();
        return backend;
    };
}

} // namespace

EmbeddingsProcess::EmbeddingsProcess(EmbeddingsConfig config, core::Doc* input_doc, BackendFactory factory)
    : core::Process(input_doc)
    , config_(std::move(config))
    , algorithm_(makeResolver(config_, std::move(factory)))
{
}

EmbeddingsProcess::~EmbeddingsProcess() = default;

IEmbeddingBackend& EmbeddingsProcess::algorithm()
{
    return *algorithm_.get();
}

void EmbeddingsProcess::run()
{
    PROFILE_SCOPE_FUNCTION();

    core::Doc& doc = requireInputDoc();
    IEmbeddingBackend& backend = algorithm();

    EmbeddingsRunStats stats;
    std::optional<std::size_t> embedding_length;

    for (auto& word : doc.words)
    {
        if (!embedding_length)
            embedding_length = backend.vectorLength();

        std::optional<Vector> vector = backend.lookup(word.string);
        if (vector && vector->size() == *embedding_length)
        {
            ++stats.found;
        }
        else
        {
            if (vector && utils::Diagnostics::IsVerbose())
            {
                PLOG_WARNING_(utils::Diagnostics::kLogInstance)
                    << "[EmbeddingsProcess] token=" << utils::Diagnostics::Preview(word.string) << " returned "
                    << vector->size() << " values, expected " << *embedding_length;
            }
            vector = Vector(*embedding_length, 0.0F);
            ++stats.zero_filled;
        }

        if (utils::Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
                << "[EmbeddingsProcess] token=" << utils::Diagnostics::Preview(word.string)
                << " vector=" << utils::Diagnostics::PreviewVector(vector->data(), vector->size());
        }

        word.embedding = std::move(vector);
        ++stats.tokens;
    }

    last_run_ = stats;
    setOutputDoc(&doc);

    PLOG_DEBUG << "[EmbeddingsProcess] language=" << config_.language << " tokens=" << stats.tokens
               << " found=" << stats.found << " zero_filled=" << stats.zero_filled;
}

} // namespace philoglot::embeddings
