#include "PipelineFactory.hpp"
#include "../core/Errors.hpp"
#include "../embeddings/EmbeddingsPresets.hpp"

#include <plog/Log.h>

namespace philoglot::pipeline
{

namespace
{

std::vector<std::string> presetLanguages()
{
    std::vector<std::string> out;
    for (const auto& preset : embeddings::allPresets())
        out.emplace_back(preset.language);
    return out;
}

} // namespace

const std::vector<std::string>& knownStages()
{
    static const std::vector<std::string> stages = { "embeddings", "wordnet" };
    return stages;
}

std::unique_ptr<Pipeline> buildPipeline(const config::PipelineSettings& settings,
                                        embeddings::BackendFactory backend_factory,
                                        wordnet::ReaderFactory reader_factory)
{
    auto pipeline = std::make_unique<Pipeline>("Pipeline for language '" + settings.language + "'", settings.language);

    for (const auto& stage : settings.stages)
    {
        if (stage == "embeddings")
        {
            auto preset = embeddings::findPreset(settings.language);
            if (!preset)
                throw core::ConfigurationError("embeddings language", settings.language, presetLanguages());

            embeddings::EmbeddingsConfig cfg = embeddings::makeConfig(*preset);
            if (settings.embeddings_variant)
                cfg.variant = *settings.embeddings_variant;

            PLOG_DEBUG << "[PipelineFactory] embeddings preset=" << preset->name << " variant=" << cfg.variant;
            pipeline->addProcess(
                std::make_unique<embeddings::EmbeddingsProcess>(std::move(cfg), nullptr, backend_factory));
        }
        else if (stage == "wordnet")
        {
            pipeline->addProcess(
                std::make_unique<wordnet::WordNetProcess>(settings.language, nullptr, reader_factory));
        }
        else
        {
            throw core::ConfigurationError("pipeline stage", stage, knownStages());
        }
    }

    return pipeline;
}

} // namespace philoglot::pipeline
