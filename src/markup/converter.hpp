#pragma once
#include <string>

namespace markguard {

// Convert lightweight Markdown to the Telegram HTML subset:
//   ```code```   -> <pre>   (an info line such as "python" is dropped)
//   `code`       -> <code>
//   [text](url)  -> <a href="url">
//   **x**, *x*   -> <b>
//   _x_          -> <i>
// Everything else is escaped, so the result always parses with
// parse_mode=HTML. Unmatched markers stay as literal text.
//
// *x* maps to <b>, not <i>. Long-standing behaviour that callers rely on.
std::string markdown_to_html(const std::string& text);

} // namespace markguard
