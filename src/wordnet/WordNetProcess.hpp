#pragma once

#include "WordNetReader.hpp"
#include "../core/CachedResolver.hpp"
#include "../core/Process.hpp"

#include <functional>
#include <memory>
#include <string>

namespace philoglot::wordnet
{

using ReaderFactory = std::function<std::unique_ptr<IWordNetReader>(const std::string& wordnet_code)>;

/**
 * @brief Wraps a WordNet corpus reader for the document's language.
 *
 * The reader is resolved once through wordnetCodeFor(); languages without a
 * WordNet resolve to nullptr, which is not an error.
 *
 * run() passes the document through untouched. Attaching sense sets to each
 * word's lemma is an extension point that needs a sense-resolution algorithm
 * before it can be filled in.
 */
class WordNetProcess : public core::Process
{
public:
    explicit WordNetProcess(std::string language, core::Doc* input_doc = nullptr, ReaderFactory factory = {});
    ~WordNetProcess() override;

    WordNetProcess(WordNetProcess&&) = default;
    WordNetProcess& operator=(WordNetProcess&&) = default;

    [[nodiscard]] std::string_view name() const override { return "wordnet"; }
    [[nodiscard]] const std::string& description() const override { return description_; }
    [[nodiscard]] const std::string& language() const noexcept { return language_; }

    // nullptr when the language has no WordNet.
    IWordNetReader* algorithm();
    [[nodiscard]] bool isAlgorithmResolved() const noexcept { return algorithm_.isResolved(); }

    void run() override;

private:
    std::string language_;
    std::string description_;
    core::CachedResolver<IWordNetReader> algorithm_;
};

} // namespace philoglot::wordnet
