#include "Process.hpp"
#include "Errors.hpp"

namespace philoglot::core
{

Process::Process(Doc* input_doc)
    : input_doc_(input_doc)
{
}

Process::~Process() = default;

void Process::setInputDoc(Doc* doc) noexcept
{
    input_doc_ = doc;
    output_doc_ = nullptr;
}

Doc& Process::requireInputDoc() const
{
    if (!input_doc_)
        throw ProcessError(std::string(name()) + ": run() called without an input document");
    return *input_doc_;
}

} // namespace philoglot::core
