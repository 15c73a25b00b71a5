#pragma once

#include "Document.hpp"

#include <string>
#include <string_view>

namespace philoglot::core
{

/**
 * @brief A configured unit of document annotation.
 *
 * A process is bound to an input document owned by the caller. run() mutates
 * that document in place and designates the output document, which for every
 * process in this project is the input itself.
 */
class Process
{
public:
    explicit Process(Doc* input_doc = nullptr);
    virtual ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept = default;
    Process& operator=(Process&&) noexcept = default;

    void setInputDoc(Doc* doc) noexcept;
    [[nodiscard]] Doc* inputDoc() const noexcept { return input_doc_; }
    [[nodiscard]] Doc* outputDoc() const noexcept { return output_doc_; }

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual const std::string& description() const = 0;

    virtual void run() = 0;

protected:
    // Throws ProcessError when no input document is bound.
    Doc& requireInputDoc() const;
    void setOutputDoc(Doc* doc) noexcept { output_doc_ = doc; }

private:
    Doc* input_doc_ = nullptr;
    Doc* output_doc_ = nullptr;
};

} // namespace philoglot::core
