#pragma once

#include "StageResult.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include <plog/Log.h>

namespace philoglot::pipeline
{

// Runs a stage (callable returning T) and produces a StageResult<T>.
// Measures duration and turns a thrown std::exception into a failed result
// that is logged and reported.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    auto start = high_resolution_clock::now();
    try
    {
        T res = fn();
        auto dur = duration_cast<microseconds>(high_resolution_clock::now() - start);
        if (utils::Diagnostics::IsVerbose())
        {
            PLOG_INFO_(utils::Diagnostics::kLogInstance)
                << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = duration_cast<microseconds>(high_resolution_clock::now() - start);
        PLOG_ERROR_(utils::Diagnostics::kLogInstance)
            << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Pipeline, "Pipeline stage failed",
                                          stage_name + ": " + ex.what());
        return StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace philoglot::pipeline
