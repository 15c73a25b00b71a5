#include "Word2VecEmbeddings.hpp"
#include "ModelPaths.hpp"

#include <plog/Log.h>

#include <utility>

namespace philoglot::embeddings
{

namespace
{

std::filesystem::path resolveModelFile(const std::string& language)
{
    auto model_id = ModelPaths::nlplModelId(language);
    if (!model_id)
        throw BackendError("NLPL word2vec embeddings are not available for language '" + language + "'");

    const auto dir = ModelPaths::nlplDirectory(language, *model_id);
    std::error_code ec;
    if (std::filesystem::exists(dir / "model.bin", ec))
        return dir / "model.bin";
    if (std::filesystem::exists(dir / "model.txt", ec))
        return dir / "model.txt";
    throw BackendError("no NLPL model (model.bin or model.txt) found in " + dir.string());
}

VectorTable loadModel(const std::filesystem::path& model_file)
{
    if (model_file.extension() == ".bin")
        return VectorTable::loadWord2VecBinary(model_file);
    return VectorTable::loadText(model_file);
}

} // namespace

Word2VecEmbeddings::Word2VecEmbeddings(std::string language)
    : Word2VecEmbeddings(language, resolveModelFile(language))
{
}

Word2VecEmbeddings::Word2VecEmbeddings(std::string language, const std::filesystem::path& model_file)
    : language_(std::move(language))
    , table_(loadModel(model_file))
{
    PLOG_DEBUG << "[Word2VecEmbeddings] language=" << language_ << " vocabulary=" << table_.size()
               << " dims=" << table_.dimensions();
}

std::optional<Vector> Word2VecEmbeddings::lookup(std::string_view token) const
{
    return table_.lookup(token);
}

} // namespace philoglot::embeddings
