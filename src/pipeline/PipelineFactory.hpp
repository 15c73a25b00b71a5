#pragma once

#include "Pipeline.hpp"
#include "../config/AppConfig.hpp"
#include "../embeddings/EmbeddingsProcess.hpp"
#include "../wordnet/WordNetProcess.hpp"

#include <memory>
#include <string>
#include <vector>

namespace philoglot::pipeline
{

// Stage names accepted in [pipeline].stages.
[[nodiscard]] const std::vector<std::string>& knownStages();

// Builds the processes named in settings.stages, in order, for settings.language.
// Throws core::ConfigurationError for an unknown stage, or for an "embeddings"
// stage on a language without an embeddings preset. An embeddings_variant
// override is passed through as-is and only validated when the process
// resolves its backend.
[[nodiscard]] std::unique_ptr<Pipeline> buildPipeline(const config::PipelineSettings& settings,
                                                      embeddings::BackendFactory backend_factory = {},
                                                      wordnet::ReaderFactory reader_factory = {});

} // namespace philoglot::pipeline
