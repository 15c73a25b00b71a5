#include "FastTextEmbeddings.hpp"
#include "ModelPaths.hpp"

#include <plog/Log.h>

#include <utility>

namespace philoglot::embeddings
{

namespace
{

std::filesystem::path resolveVecFile(const std::string& language)
{
    auto code = ModelPaths::fastTextCode(language);
    if (!code)
        throw BackendError("fastText embeddings are not available for language '" + language + "'");
    return ModelPaths::fastTextFile(language, *code);
}

} // namespace

FastTextEmbeddings::FastTextEmbeddings(std::string language)
    : FastTextEmbeddings(language, resolveVecFile(language))
{
}

FastTextEmbeddings::FastTextEmbeddings(std::string language, const std::filesystem::path& vec_file)
    : language_(std::move(language))
    , table_(VectorTable::loadText(vec_file))
{
    PLOG_DEBUG << "[FastTextEmbeddings] language=" << language_ << " vocabulary=" << table_.size()
               << " dims=" << table_.dimensions();
}

std::optional<Vector> FastTextEmbeddings::lookup(std::string_view token) const
{
    return table_.lookup(token);
}

} // namespace philoglot::embeddings
