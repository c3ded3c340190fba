#include "feature_scanner.h"

#include <string>

#include <glog/logging.h>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"

namespace Sluice {

namespace {

constexpr std::string_view kHydrationMarkers[] = {
    "__next_data__", "__nuxt__", "data-reactroot", "ng-version",
    "window.__initial_state__", "data-server-rendered",
};

constexpr std::string_view kFrameworkRootIds[] = {
    "id=\"root\"", "id=\"app\"", "id=\"__next\"", "id='root'", "id='app'", "id='__next'",
};

constexpr std::string_view kJsonLdArticleTypes[] = {
    "\"article\"", "\"newsarticle\"", "\"blogposting\"",
};

bool ContainsAny(std::string_view haystack, const std::string_view* needles, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (haystack.find(needles[i]) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

template<size_t N>
bool ContainsAny(std::string_view haystack, const std::string_view (&needles)[N]) {
    return ContainsAny(haystack, needles, N);
}

bool IsHeading(std::string_view name) {
    return name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6';
}

// Position just past "</name ... >" starting at |from|, or npos.
size_t SkipToClosingTag(const std::string& lower, size_t from, std::string_view name,
                        size_t* content_end) {
    const std::string closing = "</" + std::string(name);
    size_t close = lower.find(closing, from);
    if (close == std::string::npos) {
        *content_end = lower.size();
        return std::string::npos;
    }
    *content_end = close;
    size_t gt = lower.find('>', close);
    return gt == std::string::npos ? std::string::npos : gt + 1;
}

} // namespace

GateFeatures FeatureScanner::ScanHtml(std::string_view html, double domain_prior) {
    GateFeatures features;
    features.html_bytes = html.size();
    features.domain_prior = domain_prior;

    const std::string lower = absl::AsciiStrToLower(html);
    const size_t n = lower.size();

    uint32_t script_count = 0;
    bool in_whitespace_run = true;
    size_t i = 0;

    while (i < n) {
        const char c = lower[i];
        if (c != '<') {
            if (absl::ascii_isspace(static_cast<unsigned char>(c))) {
                if (!in_whitespace_run) {
                    ++features.visible_text_chars;
                    in_whitespace_run = true;
                }
            } else {
                ++features.visible_text_chars;
                in_whitespace_run = false;
            }
            ++i;
            continue;
        }

        if (lower.compare(i, 4, "<!--") == 0) {
            size_t end = lower.find("-->", i + 4);
            i = (end == std::string::npos) ? n : end + 3;
            continue;
        }

        size_t tag_end = lower.find('>', i + 1);
        if (tag_end == std::string::npos) {
            break;
        }

        size_t name_begin = i + 1;
        const bool closing = name_begin < n && lower[name_begin] == '/';
        if (closing) {
            ++name_begin;
        }
        size_t name_end = name_begin;
        while (name_end < tag_end && absl::ascii_isalnum(static_cast<unsigned char>(lower[name_end]))) {
            ++name_end;
        }
        const std::string_view name(lower.data() + name_begin, name_end - name_begin);
        const std::string_view attrs(lower.data() + name_end, tag_end - name_end);
        i = tag_end + 1;

        if (closing || name.empty()) {
            continue;
        }

        if (ContainsAny(attrs, kHydrationMarkers)) {
            features.spa_marker_flags |= kSpaHydrationMarkers;
        }

        if (name == "script") {
            ++script_count;
            size_t content_end = n;
            size_t next = SkipToClosingTag(lower, i, "script", &content_end);
            const std::string_view content(lower.data() + i, content_end - i);
            features.script_bytes += content.size();

            if (content.size() > kOversizedInlineScriptBytes) {
                features.spa_marker_flags |= kSpaOversizedBundle;
            }
            if (ContainsAny(content, kHydrationMarkers)) {
                features.spa_marker_flags |= kSpaHydrationMarkers;
            }
            if (absl::StrContains(attrs, "application/ld+json") &&
                ContainsAny(content, kJsonLdArticleTypes)) {
                features.has_jsonld_article = true;
            }
            i = (next == std::string::npos) ? n : next;
            continue;
        }

        if (name == "style" || name == "noscript" || name == "template") {
            size_t content_end = n;
            size_t next = SkipToClosingTag(lower, i, name, &content_end);
            i = (next == std::string::npos) ? n : next;
            continue;
        }

        if (name == "p") {
            ++features.paragraph_count;
        } else if (name == "article") {
            ++features.article_tag_count;
        } else if (IsHeading(name)) {
            ++features.heading_count;
        } else if (name == "meta") {
            if (absl::StrContains(attrs, "og:title")) {
                features.has_open_graph_title = true;
            }
        } else if (name == "div") {
            if (ContainsAny(attrs, kFrameworkRootIds)) {
                features.spa_marker_flags |= kSpaFrameworkRootDiv;
            }
        }
    }

    if (features.html_bytes > 0 &&
        static_cast<double>(features.script_bytes) >
            kOversizedScriptShare * static_cast<double>(features.html_bytes)) {
        features.spa_marker_flags |= kSpaOversizedBundle;
    }
    if (script_count > 0 && features.visible_text_chars < kSpaOnlyTextChars) {
        features.spa_marker_flags |= kSpaOnlyContent;
    }

    VLOG(3) << "FeatureScanner: bytes=" << features.html_bytes
            << " text=" << features.visible_text_chars
            << " p=" << features.paragraph_count
            << " scripts=" << script_count
            << " spa_flags=" << static_cast<int>(features.spa_marker_flags);
    return features;
}

} // namespace Sluice
