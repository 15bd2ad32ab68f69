#include "normalizer.hpp"

namespace splice::engine {

    namespace {

        bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
        }

        // Maps the UTF-8 encodings of look-alike punctuation onto ASCII.
        std::string fold_punctuation(const std::string& line) {
            std::string out;
            out.reserve(line.size());
            const size_t n = line.size();
            for (size_t i = 0; i < n; ++i) {
                unsigned char c = static_cast<unsigned char>(line[i]);
                if (c == 0xC2 && i + 1 < n) {
                    unsigned char c1 = static_cast<unsigned char>(line[i + 1]);
                    if (c1 == 0xA0) { out += ' '; ++i; continue; }               // no-break space
                    if (c1 == 0xAB || c1 == 0xBB) { out += '"'; ++i; continue; } // guillemets
                } else if (c == 0xE2 && i + 2 < n) {
                    unsigned char c1 = static_cast<unsigned char>(line[i + 1]);
                    unsigned char c2 = static_cast<unsigned char>(line[i + 2]);
                    char mapped = 0;
                    if (c1 == 0x80) {
                        if (c2 >= 0x90 && c2 <= 0x94) mapped = '-';
                        else if (c2 == 0x9C || c2 == 0x9D || c2 == 0x9E) mapped = '"';
                        else if (c2 == 0x98 || c2 == 0x99 || c2 == 0x9B) mapped = '\'';
                        else if (c2 == 0xAF) mapped = ' '; // narrow no-break space
                    } else if (c1 == 0x88 && c2 == 0x92) {
                        mapped = '-'; // minus sign
                    }
                    if (mapped) {
                        out += mapped;
                        i += 2;
                        continue;
                    }
                }
                out += line[i];
            }
            return out;
        }

    }

    Normalizer::Normalizer(size_t tab_width) : m_tab_width(tab_width ? tab_width : 4) {}

    NormalizedLine Normalizer::normalize(const std::string& line) const {
        const std::string folded = fold_punctuation(line);

        size_t col = 0;
        size_t i = 0;
        while (i < folded.size() && (folded[i] == ' ' || folded[i] == '\t')) {
            if (folded[i] == '\t') col = (col / m_tab_width + 1) * m_tab_width;
            else ++col;
            ++i;
        }

        NormalizedLine result;
        result.text.assign(col, ' ');
        bool pending_space = false;
        bool any = false;
        for (; i < folded.size(); ++i) {
            char c = folded[i];
            if (is_space(c)) {
                pending_space = any;
                continue;
            }
            if (pending_space) {
                result.text += ' ';
                pending_space = false;
            }
            result.text += c;
            any = true;
        }

        if (!any) result.text.clear();
        return result;
    }

    std::vector<NormalizedLine> Normalizer::normalize_all(const std::vector<std::string>& lines) const {
        std::vector<NormalizedLine> out;
        out.reserve(lines.size());
        for (const auto& line : lines) {
            out.push_back(normalize(line));
        }
        return out;
    }

    bool Normalizer::fuzzy_equal(const std::string& a, const std::string& b) const {
        return normalize(a) == normalize(b);
    }

    size_t Normalizer::indent_width(const std::string& line) const {
        NormalizedLine n = normalize(line);
        if (n.text.empty()) return std::string::npos;
        return n.text.find_first_not_of(' ');
    }

}
