#include "Pipeline.hpp"
#include "StageRunner.hpp"
#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

#include <utility>

namespace philoglot::pipeline
{

bool PipelineReport::succeeded() const
{
    return firstFailure() == nullptr;
}

const StageResult<std::size_t>* PipelineReport::firstFailure() const
{
    for (const auto& stage : stages)
    {
        if (!stage.succeeded)
            return &stage;
    }
    return nullptr;
}

std::chrono::microseconds PipelineReport::totalDuration() const
{
    std::chrono::microseconds total{ 0 };
    for (const auto& stage : stages)
        total += stage.duration;
    return total;
}

Pipeline::Pipeline(std::string description, std::string language)
    : description_(std::move(description))
    , language_(std::move(language))
{
}

Pipeline::~Pipeline() = default;

void Pipeline::addProcess(std::unique_ptr<core::Process> process)
{
    if (process)
        processes_.push_back(std::move(process));
}

PipelineReport Pipeline::run(core::Doc& doc)
{
    PROFILE_SCOPE_FUNCTION();

    if (doc.language.empty())
        doc.language = language_;

    if (utils::Diagnostics::IsVerbose())
    {
        PLOG_INFO_(utils::Diagnostics::kLogInstance)
            << "[Pipeline] start language=" << language_ << " words=" << doc.words.size()
            << " raw=" << utils::Diagnostics::Preview(doc.raw);
    }

    PipelineReport report;
    core::Doc* current = &doc;
    for (const auto& process : processes_)
    {
        process->setInputDoc(current);
        auto stage = run_stage<std::size_t>(std::string(process->name()),
                                            [&]()
                                            {
                                                process->run();
                                                return process->inputDoc()->words.size();
                                            });
        report.stages.push_back(std::move(stage));
        if (!report.stages.back().succeeded)
        {
            PLOG_WARNING << "[Pipeline] stopping after failed stage '" << report.stages.back().stage_name << "'";
            break;
        }
        if (process->outputDoc())
            current = process->outputDoc();
    }

    PLOG_INFO << "[Pipeline] " << description_ << ": " << report.stages.size() << "/" << processes_.size()
              << " stages, " << (report.succeeded() ? "ok" : "failed") << " in " << report.totalDuration().count()
              << "us";
    return report;
}

} // namespace philoglot::pipeline
