#include "IEmbeddingBackend.hpp"
#include "FastTextEmbeddings.hpp"
#include "Word2VecEmbeddings.hpp"

#include <memory>

namespace philoglot::embeddings
{

std::unique_ptr<IEmbeddingBackend> createEmbeddingBackend(EmbeddingVariant variant, const std::string& language)
{
    switch (variant)
    {
    case EmbeddingVariant::FastText:
        return std::make_unique<FastTextEmbeddings>(language);
    case EmbeddingVariant::Nlpl:
        return std::make_unique<Word2VecEmbeddings>(language);
    }
    return nullptr;
}

} // namespace philoglot::embeddings
