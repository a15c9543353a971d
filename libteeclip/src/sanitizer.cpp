/**
 * @file sanitizer.cpp
 * @brief ANSI/OSC/DCS stripping and whitespace trimming
 */

#include "teeclip/sanitizer.h"
#include <vector>

namespace teeclip {

namespace {

constexpr char ESC = '\x1b';
constexpr char BEL = '\x07';

constexpr const char *WHITESPACE = " \t\n\v\f\r";

bool in_range(char c, char lo, char hi) { return c >= lo && c <= hi; }

/**
 * @brief Single-pass escape sequence remover
 *
 * Recognised shapes, tried in this order at each ESC:
 *   CSI       ESC [ params(0-9 ; ?) intermediates(SP-/) final(@-~)
 *   OSC       ESC ] data (BEL | ESC \)
 *   DCS/SOS/PM/APC  ESC P|X|^|_ data ESC \
 *   charset   ESC ( or ) followed by A B 0 1 2
 *   short     ESC A-Z or ESC \
 *
 * Bytes are copied to the output as they arrive. Every ESC that may still
 * begin a sequence is kept on a stack together with its output offset and
 * parse state. A sequence that completes is cut from the output and the
 * sequence below it resumes, so text spliced together by the removal is
 * parsed as if it had been contiguous. An ESC stays in the output only
 * when nothing after it can complete it, which makes the result free of
 * recognised sequences.
 *
 * An unterminated DCS or SOS still matches as the two-byte ESC P / ESC X
 * form; its payload is then fed to the sequence below it.
 */
class Stripper {
public:
  explicit Stripper(size_t size_hint) { out_.reserve(size_hint); }

  void run(const std::string &text) {
    size_t pos = 0;
    while (pos < text.size()) {
      if (open_.empty()) {
        size_t esc = text.find(ESC, pos);
        if (esc == std::string::npos) {
          out_.append(text, pos, std::string::npos);
          return;
        }
        out_.append(text, pos, esc - pos);
        pos = esc;
      }
      feed(text[pos++]);
    }
  }

  std::string finish() {
    if (!open_.empty()) {
      const Open &top = open_.back();
      if (top.phase == Phase::StringData && is_short_string(top.intro)) {
        fall_back_to_short_form();
      } else if (top.phase == Phase::StringEsc) {
        fall_back_to_short_form();
        feed(ESC);
      }
    }
    open_.clear();
    return std::move(out_);
  }

private:
  enum class Phase {
    Intro,            ///< ESC seen
    CsiParams,        ///< ESC [ params
    CsiIntermediates, ///< ESC [ ... intermediates
    OscData,          ///< ESC ] data
    StringData,       ///< ESC P|X|^|_ data
    StringEsc,        ///< ESC P|X data ESC, waiting for '\'
    Charset           ///< ESC ( or ESC )
  };

  struct Open {
    size_t offset;
    Phase phase;
    char intro;
  };

  static bool is_short_string(char intro) {
    return intro == 'P' || intro == 'X';
  }

  void feed(char c) {
    if (open_.empty()) {
      if (c == ESC) {
        open_.push_back({out_.size(), Phase::Intro, 0});
      }
      out_.push_back(c);
      return;
    }

    Open &top = open_.back();

    if (top.phase == Phase::StringEsc) {
      if (c == '\\') {
        complete();
      } else {
        fall_back_to_short_form();
        feed(ESC);
        feed(c);
      }
      return;
    }

    if (c == ESC) {
      if (top.phase == Phase::StringData && is_short_string(top.intro)) {
        // Held back until the next byte decides between ESC \ and fallback
        top.phase = Phase::StringEsc;
        return;
      }
      open_.push_back({out_.size(), Phase::Intro, 0});
      out_.push_back(c);
      return;
    }

    switch (top.phase) {
    case Phase::Intro:
      start(c);
      return;

    case Phase::CsiParams:
      if (in_range(c, '0', '9') || c == ';' || c == '?') {
        out_.push_back(c);
      } else if (in_range(c, ' ', '/')) {
        top.phase = Phase::CsiIntermediates;
        out_.push_back(c);
      } else if (in_range(c, '@', '~')) {
        complete();
      } else {
        fail(c);
      }
      return;

    case Phase::CsiIntermediates:
      if (in_range(c, ' ', '/')) {
        out_.push_back(c);
      } else if (in_range(c, '@', '~')) {
        complete();
      } else {
        fail(c);
      }
      return;

    case Phase::OscData:
      if (c == BEL) {
        complete();
      } else {
        out_.push_back(c);
      }
      return;

    case Phase::StringData:
      out_.push_back(c);
      return;

    case Phase::Charset:
      if (c == 'A' || c == 'B' || in_range(c, '0', '2')) {
        complete();
      } else {
        fail(c);
      }
      return;

    case Phase::StringEsc:
      return;
    }
  }

  /// Byte after a bare ESC
  void start(char c) {
    // ESC \ inside OSC/PM/APC data terminates the enclosing sequence
    if (c == '\\' && open_.size() > 1) {
      const Open &outer = open_[open_.size() - 2];
      if (outer.phase == Phase::OscData || outer.phase == Phase::StringData) {
        open_.pop_back();
        complete();
        return;
      }
    }

    Open &top = open_.back();
    switch (c) {
    case '[':
      top.phase = Phase::CsiParams;
      break;
    case ']':
      top.phase = Phase::OscData;
      break;
    case 'P':
    case 'X':
    case '^':
    case '_':
      top.phase = Phase::StringData;
      top.intro = c;
      break;
    case '(':
    case ')':
      top.phase = Phase::Charset;
      break;
    default:
      if (in_range(c, 'A', 'Z') || c == '\\') {
        complete();
      } else {
        fail(c);
      }
      return;
    }
    out_.push_back(c);
  }

  /// Cut the innermost open sequence from the output
  void complete() {
    out_.resize(open_.back().offset);
    open_.pop_back();
  }

  /// A byte no open sequence accepts: every open ESC stays as text
  void fail(char c) {
    open_.clear();
    out_.push_back(c);
  }

  /// Drop ESC P / ESC X and replay its payload to the sequence below
  void fall_back_to_short_form() {
    size_t offset = open_.back().offset;
    open_.pop_back();
    std::string payload = out_.substr(offset + 2);
    out_.resize(offset);
    for (char c : payload) {
      feed(c);
    }
  }

  std::string out_;
  std::vector<Open> open_;
};

} // namespace

std::string strip_ansi(const std::string &text) {
  if (text.find(ESC) == std::string::npos) {
    return text;
  }

  Stripper stripper(text.size());
  stripper.run(text);
  return stripper.finish();
}

std::string trim_whitespace(const std::string &text) {
  auto first = text.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) {
    return "";
  }
  auto last = text.find_last_not_of(WHITESPACE);
  return text.substr(first, last - first + 1);
}

std::string sanitize(const std::string &text, const SanitizeOptions &options) {
  std::string result = options.strip_ansi ? strip_ansi(text) : text;
  if (options.trim) {
    result = trim_whitespace(result);
  }
  return result;
}

} // namespace teeclip
