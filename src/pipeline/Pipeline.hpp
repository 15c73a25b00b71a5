#pragma once

#include "StageResult.hpp"
#include "../core/Process.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace philoglot::pipeline
{

struct PipelineReport
{
    // One entry per executed process; payload is the number of words seen.
    std::vector<StageResult<std::size_t>> stages;

    [[nodiscard]] bool succeeded() const;
    [[nodiscard]] const StageResult<std::size_t>* firstFailure() const;
    [[nodiscard]] std::chrono::microseconds totalDuration() const;
};

/**
 * @brief Ordered sequence of processes applied to one document.
 *
 * Each process is bound to the output of the previous one and run as a timed
 * stage. The first failing stage stops the run; later processes are not
 * executed and the document keeps whatever earlier stages wrote.
 */
class Pipeline
{
public:
    Pipeline(std::string description, std::string language);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    void addProcess(std::unique_ptr<core::Process> process);

    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] const std::string& language() const noexcept { return language_; }
    [[nodiscard]] std::size_t size() const noexcept { return processes_.size(); }
    [[nodiscard]] core::Process& process(std::size_t index) const { return *processes_.at(index); }

    [[nodiscard]] PipelineReport run(core::Doc& doc);

private:
    std::string description_;
    std::string language_;
    std::vector<std::unique_ptr<core::Process>> processes_;
};

} // namespace philoglot::pipeline
