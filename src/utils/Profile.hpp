#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// PHILOGLOT_PROFILING_LEVEL is set via CMake:
//   0 = Disabled (no profiling)
//   1 = Timer only (std::chrono + plog)
//   2 = Tracy + Timer (full profiling)

#ifndef PHILOGLOT_PROFILING_LEVEL
#define PHILOGLOT_PROFILING_LEVEL 0
#endif

#if PHILOGLOT_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if PHILOGLOT_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace philoglot::profiling
{

#if PHILOGLOT_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;
#endif

namespace detail
{

#if PHILOGLOT_PROFILING_LEVEL >= 1
/**
 * @brief RAII scope timer for measuring and logging execution time
 *
 * Captures start time on construction and logs elapsed time on destruction.
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name) noexcept
        : name_(name)
        , start_(std::chrono::high_resolution_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
        PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << duration.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

private:
    std::string_view name_;
    std::chrono::time_point<std::chrono::high_resolution_clock> start_;
};
#endif

#if PHILOGLOT_PROFILING_LEVEL >= 2
inline constexpr std::uint16_t clampLength(std::size_t length) noexcept
{
    return length > static_cast<std::size_t>(0xFFFF) ? static_cast<std::uint16_t>(0xFFFF) :
                                                       static_cast<std::uint16_t>(length);
}

inline std::string_view ToStringView(std::string_view name) noexcept { return name; }

inline std::string_view ToStringView(const std::string& name) noexcept { return std::string_view{ name }; }

inline std::string_view ToStringView(const char* name) noexcept
{
    return name ? std::string_view{ name } : std::string_view{};
}
#endif

} // namespace detail

} // namespace philoglot::profiling

#if PHILOGLOT_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))

#elif PHILOGLOT_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_FUNCTION() ::philoglot::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::philoglot::profiling::detail::ScopeTimer __profiling_timer(nameExpr)

#elif PHILOGLOT_PROFILING_LEVEL >= 2
#define PROFILE_SCOPE_FUNCTION() \
    ZoneScopedN(__FUNCTION__);   \
    ::philoglot::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)

#define PROFILE_SCOPE_CUSTOM(nameExpr)                                                                     \
    ZoneScoped;                                                                                            \
    ::philoglot::profiling::detail::ScopeTimer __profiling_timer(nameExpr);                                \
    if (auto __profiling_scope_name = ::philoglot::profiling::detail::ToStringView(nameExpr);              \
        !__profiling_scope_name.empty())                                                                   \
    {                                                                                                      \
        ZoneName(__profiling_scope_name.data(),                                                            \
                 ::philoglot::profiling::detail::clampLength(__profiling_scope_name.size()));              \
    }

#endif
