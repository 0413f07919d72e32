/**
 * @file keyboard/common/linux_layout.cpp
 * @brief Internal helpers for detecting the session's XKB keyboard layout.
 */

#include "keyboard/common/linux_layout.hpp"

#include <kbtap-io/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace kbtap::io::keyboard::detail {

namespace {

void trimInPlace(std::string &s) {
  const char *ws = " \t\r\n";
  size_t a = s.find_first_not_of(ws);
  if (a == std::string::npos) {
    s.clear();
    return;
  }
  size_t b = s.find_last_not_of(ws);
  s = s.substr(a, b - a + 1);
}

void stripSurroundingQuotes(std::string &s) {
  if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                        (s.front() == '\'' && s.back() == '\''))) {
    s = s.substr(1, s.size() - 2);
  }
}

std::string upper(std::string s) {
  std::ranges::transform(s, s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

std::string lower(std::string s) {
  std::ranges::transform(s, s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

void setIfEmpty(std::string &dst, const std::string &value) {
  if (dst.empty())
    dst = value;
}

void readEnvironment(XkbRuleNamesStrings &out) {
  struct {
    const char *var;
    std::string *field;
  } const vars[] = {
      {"XKB_DEFAULT_RULES", &out.rules},
      {"XKB_DEFAULT_MODEL", &out.model},
      {"XKB_DEFAULT_LAYOUT", &out.layout},
      {"XKB_DEFAULT_VARIANT", &out.variant},
      {"XKB_DEFAULT_OPTIONS", &out.options},
  };
  for (const auto &v : vars) {
    if (const char *env = std::getenv(v.var))
      *v.field = env;
    trimInPlace(*v.field);
  }
}

// Locale heuristic: en_GB -> gb, pt_BR -> br, da -> dk, sv -> se, otherwise
// the language code itself.
std::string layoutFromLocale() {
  const char *localeEnv = std::getenv("LC_ALL");
  if (!localeEnv)
    localeEnv = std::getenv("LC_MESSAGES");
  if (!localeEnv)
    localeEnv = std::getenv("LANG");
  if (!localeEnv)
    return {};

  std::string locale(localeEnv);
  if (size_t dot = locale.find('.'); dot != std::string::npos)
    locale.resize(dot);
  if (size_t at = locale.find('@'); at != std::string::npos)
    locale.resize(at);

  std::string lang = locale;
  std::string region;
  if (size_t us = locale.find('_'); us != std::string::npos) {
    lang = locale.substr(0, us);
    region = locale.substr(us + 1);
  }
  lang = lower(lang);
  region = upper(region);

  if (lang == "c" || lang == "posix")
    return {};
  if (lang == "en")
    return (region == "GB" || region == "UK") ? "gb" : "us";
  if (lang == "pt" && region == "BR")
    return "br";
  if (lang == "da")
    return "dk";
  if (lang == "sv")
    return "se";
  return lang;
}

} // namespace

void applyKeyboardDefaults(const std::string &content,
                           XkbRuleNamesStrings &out) {
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    size_t comment = line.find('#');
    if (comment != std::string::npos)
      line.resize(comment);
    trimInPlace(line);
    if (line.empty())
      continue;

    size_t eq = line.find('=');
    if (eq == std::string::npos)
      continue;

    std::string key = line.substr(0, eq);
    trimInPlace(key);
    key = upper(key);
    std::string val = line.substr(eq + 1);
    trimInPlace(val);
    stripSurroundingQuotes(val);
    trimInPlace(val);
    if (val.empty())
      continue;

    if (key == "XKBRULES" || key == "XKB_DEFAULT_RULES")
      setIfEmpty(out.rules, val);
    else if (key == "XKBMODEL" || key == "XKB_DEFAULT_MODEL")
      setIfEmpty(out.model, val);
    else if (key == "XKBLAYOUT" || key == "XKB_DEFAULT_LAYOUT")
      setIfEmpty(out.layout, val);
    else if (key == "XKBVARIANT" || key == "XKB_DEFAULT_VARIANT")
      setIfEmpty(out.variant, val);
    else if (key == "XKBOPTIONS" || key == "XKB_DEFAULT_OPTIONS")
      setIfEmpty(out.options, val);
  }
}

XkbRuleNamesStrings detectXkbRuleNames() {
  XkbRuleNamesStrings out;
  readEnvironment(out);

  if (out.rules.empty() || out.model.empty() || out.layout.empty() ||
      out.variant.empty() || out.options.empty()) {
    std::ifstream f("/etc/default/keyboard");
    if (f) {
      std::stringstream buffer;
      buffer << f.rdbuf();
      applyKeyboardDefaults(buffer.str(), out);
    }
  }

  if (out.layout.empty()) {
    out.layout = layoutFromLocale();
    if (!out.layout.empty())
      KBTAP_IO_LOG_DEBUG("XKB layout guessed from locale: %s",
                         out.layout.c_str());
  }
  return out;
}

std::string bundledLayoutFor(const XkbRuleNamesStrings &names) {
  // Multi-layout configurations ("us,de") list the primary layout first.
  std::string layout = lower(names.layout.substr(0, names.layout.find(',')));
  std::string variant =
      lower(names.variant.substr(0, names.variant.find(',')));

  if (variant.find("colemak_dh") != std::string::npos ||
      variant.find("colemak-dh") != std::string::npos)
    return "colemak-dh";
  if (variant.find("colemak") != std::string::npos)
    return "colemak";
  if (layout == "de" || layout == "at" || layout == "ch")
    return "qwertz";
  return "qwerty";
}

} // namespace kbtap::io::keyboard::detail
