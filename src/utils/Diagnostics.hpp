#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace philoglot::utils
{

// Verbose stage tracing for the annotation pipeline. Trace lines go to the
// plog instance kLogInstance so they can be routed to their own file.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    [[nodiscard]] static std::string Preview(std::string_view text);

    // "[0.125, -0.5, 0.75, ... (300 dims)]"
    [[nodiscard]] static std::string PreviewVector(const float* data, std::size_t size, std::size_t max_values = 4);

private:
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace philoglot::utils
