#pragma once

#include <string>
#include <vector>

namespace splice::engine {

    /**
     * @brief Comparison-only form of a source line.
     */
    struct NormalizedLine {
        std::string text;

        bool operator==(const NormalizedLine& other) const { return text == other.text; }
        bool operator!=(const NormalizedLine& other) const { return text != other.text; }

        // Same line with its leading indentation removed.
        NormalizedLine unindented() const {
            size_t first = text.find_first_not_of(' ');
            return NormalizedLine{first == std::string::npos ? std::string() : text.substr(first)};
        }
    };

    class Normalizer {
    public:
        explicit Normalizer(size_t tab_width = 4);

        /**
         * @brief Canonicalizes a line for fuzzy comparison.
         *
         * Leading indentation becomes spaces (tabs expanded to the tab stop),
         * trailing whitespace is dropped, interior whitespace runs collapse to a
         * single space and typographic dashes, quotes and no-break spaces fold
         * to their ASCII counterparts. The result is never written anywhere.
         */
        NormalizedLine normalize(const std::string& line) const;

        std::vector<NormalizedLine> normalize_all(const std::vector<std::string>& lines) const;

        bool fuzzy_equal(const std::string& a, const std::string& b) const;

        /**
         * @brief Display width of the leading indentation.
         * @return npos for blank lines.
         */
        size_t indent_width(const std::string& line) const;

    private:
        size_t m_tab_width;
    };

}
