#pragma once

#include "../core/Document.hpp"

#include <nlohmann/json.hpp>

namespace philoglot::app
{

// {"raw": ..., "language": ..., "words": [{"index": 0, "string": "a",
//   "lemma": null, "embedding": [..] or null}]}
[[nodiscard]] nlohmann::json toJson(const core::Doc& doc);

} // namespace philoglot::app
