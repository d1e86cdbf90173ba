#include "markup/converter.hpp"
#include "markup/protector.hpp"
#include "util.hpp"

namespace markguard {

namespace {

// Wrap every match of `pattern` in <tag>..</tag>. Tags emitted by earlier
// passes split the text into segments and no match may cross one, so the
// output never has overlapping elements.
std::string rewrite(const std::string& text, const Pattern& pattern, const std::string& tag) {
    std::string out;
    out.reserve(text.size() + 16);

    auto rewrite_segment = [&](const std::string& seg) {
        size_t pos = 0;
        while (auto m = pattern.find(seg, pos)) {
            out.append(seg, pos, m->begin - pos);
            out += "<" + tag + ">" + m->groups[0] + "</" + tag + ">";
            pos = m->end;
        }
        out.append(seg, pos, std::string::npos);
    };

    size_t pos = 0;
    while (pos < text.size()) {
        size_t lt = text.find('<', pos);
        if (lt == std::string::npos) {
            rewrite_segment(text.substr(pos));
            break;
        }
        rewrite_segment(text.substr(pos, lt - pos));
        size_t gt = text.find('>', lt);
        if (gt == std::string::npos) gt = text.size() - 1;
        out.append(text, lt, gt + 1 - lt);
        pos = gt + 1;
    }
    return out;
}

// Input is already escaped; only our own tags contain '<'
std::string emphasize(const std::string& escaped) {
    const auto& p = patterns();
    std::string s = rewrite(escaped, p.bold_double, "b");
    s = rewrite(s, p.bold_single, "b");
    return rewrite(s, p.italic, "i");
}

std::string render(const EntityProtector& protector, const ProtectedSpan& span, bool in_link) {
    switch (span.kind) {
        case SpanKind::CodeBlock:
            if (in_link) return html_escape(protector.restore(span.raw));
            return "<pre>" + html_escape(protector.restore(span.groups[0])) + "</pre>";
        case SpanKind::InlineCode:
            return "<code>" + html_escape(protector.restore(span.groups[0])) + "</code>";
        case SpanKind::Link: {
            if (in_link) return html_escape(protector.restore(span.raw));
            std::string label = protector.restore(
                emphasize(html_escape(span.groups[0])),
                [&protector](const ProtectedSpan& inner) { return render(protector, inner, true); });
            std::string href = html_escape_attr(protector.restore(span.groups[1]));
            return "<a href=\"" + href + "\">" + label + "</a>";
        }
    }
    return html_escape(protector.restore(span.raw));
}

} // namespace

std::string markdown_to_html(const std::string& input) {
    std::string text = EntityProtector::scrub(input);
    if (text.empty()) return text;

    const auto& p = patterns();
    EntityProtector protector;

    text = protector.protect(text, p.code_block_with_info, SpanKind::CodeBlock);
    text = protector.protect(text, p.inline_code, SpanKind::InlineCode);
    text = protector.protect(text, p.link, SpanKind::Link);

    text = emphasize(html_escape(text));

    return protector.restore(text, [&protector](const ProtectedSpan& span) {
        return render(protector, span, false);
    });
}

} // namespace markguard
