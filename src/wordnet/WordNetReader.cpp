#include "WordNetReader.hpp"

#include <plog/Log.h>

#include <mutex>
#include <utility>

namespace philoglot::wordnet
{

namespace
{

std::mutex g_root_mutex;
std::filesystem::path g_data_root = "wordnet";

} // namespace

WordNetCorpusReader::WordNetCorpusReader(std::string language_code)
    : WordNetCorpusReader(std::move(language_code), DataRoot())
{
}

WordNetCorpusReader::WordNetCorpusReader(std::string language_code, std::filesystem::path data_root)
    : language_(std::move(language_code))
    , data_directory_(std::move(data_root) / language_)
{
    PLOG_DEBUG << "[WordNetCorpusReader] language=" << language_ << " data=" << data_directory_.string();
}

void WordNetCorpusReader::SetDataRoot(std::filesystem::path root)
{
    std::lock_guard<std::mutex> lock(g_root_mutex);
    g_data_root = std::move(root);
}

std::filesystem::path WordNetCorpusReader::DataRoot()
{
    std::lock_guard<std::mutex> lock(g_root_mutex);
    return g_data_root;
}

std::optional<std::string> wordnetCodeFor(std::string_view language)
{
    if (language == "lat")
        return std::string("lat");
    if (language == "grc")
        return std::string("grk");
    if (language == "san")
        return std::string("skt");
    return std::nullopt;
}

} // namespace philoglot::wordnet
