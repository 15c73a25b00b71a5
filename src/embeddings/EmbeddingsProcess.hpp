#pragma once

#include "IEmbeddingBackend.hpp"
#include "../core/CachedResolver.hpp"
#include "../core/Process.hpp"

#include <functional>
#include <memory>
#include <string>

namespace philoglot::embeddings
{

struct EmbeddingsConfig
{
    std::string language;
    std::string variant = std::string(kDefaultVariantName);
    std::string description;
};

using BackendFactory = std::function<std::unique_ptr<IEmbeddingBackend>(EmbeddingVariant, const std::string&)>;

// Counters from the most recent run().
struct EmbeddingsRunStats
{
    std::size_t tokens = 0;
    std::size_t found = 0;
    std::size_t zero_filled = 0;
};

/**
 * @brief Attaches a word vector to every token of the bound document.
 *
 * The backend is resolved from (language, variant) on first use and kept for
 * the lifetime of this instance. Tokens without a usable vector get a zero
 * vector of the backend's length, so after run() every word carries an
 * embedding of the same size.
 *
 * Errors: an unknown variant raises core::ConfigurationError on first
 * resolution; anything the backend throws propagates unchanged.
 */
class EmbeddingsProcess : public core::Process
{
public:
    explicit EmbeddingsProcess(EmbeddingsConfig config, core::Doc* input_doc = nullptr,
                               BackendFactory factory = {});
    ~EmbeddingsProcess() override;

    EmbeddingsProcess(EmbeddingsProcess&&) = default;
    EmbeddingsProcess& operator=(EmbeddingsProcess&&) = default;

    [[nodiscard]] std::string_view name() const override { return "embeddings"; }
    [[nodiscard]] const std::string& description() const override { return config_.description; }
    [[nodiscard]] const EmbeddingsConfig& config() const noexcept { return config_; }

    // Resolves the backend on first call; the same object on every later call.
    IEmbeddingBackend& algorithm();
    [[nodiscard]] bool isAlgorithmResolved() const noexcept { return algorithm_.isResolved(); }

    void run() override;

    [[nodiscard]] const EmbeddingsRunStats& lastRunStats() const noexcept { return last_run_; }

private:
    EmbeddingsConfig config_;
    core::CachedResolver<IEmbeddingBackend> algorithm_;
    EmbeddingsRunStats last_run_;
};

} // namespace philoglot::embeddings
