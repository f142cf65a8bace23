#pragma once
#include <QColor>
#include <optional>
#include <string_view>

namespace vantage::ColorParser {

// CSS colour strings as producers send them: rgba()/rgb(), #rgb, #rrggbb, #rrggbbaa, named.
// nullopt for empty or unparseable input.
std::optional<QColor> parse(std::string_view css);

QColor parseOr(std::string_view css, const QColor& fallback);

} // namespace vantage::ColorParser
