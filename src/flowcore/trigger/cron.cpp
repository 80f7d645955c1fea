#include "flowcore/trigger/cron.hpp"
#include "flowcore/util/conv.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <vector>

namespace flowcore {
namespace {

struct Macro {
  std::string_view name;
  std::string_view expansion;
};

constexpr std::array kMacros{
    Macro{"@yearly", "0 0 1 1 *"},  Macro{"@annually", "0 0 1 1 *"},
    Macro{"@monthly", "0 0 1 * *"}, Macro{"@weekly", "0 0 * * 0"},
    Macro{"@daily", "0 0 * * *"},   Macro{"@hourly", "0 * * * *"},
};

constexpr std::array<std::string_view, 12> kMonths{
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};
constexpr std::array<std::string_view, 7> kWeekdays{"sun", "mon", "tue", "wed",
                                                    "thu", "fri", "sat"};

// Value bounds of one field. `first_name` is the value of names[0].
struct FieldSpec {
  int lo;
  int hi;
  std::span<const std::string_view> names{};
  int first_name{0};
  // Day-of-week also accepts 7 for Sunday.
  bool sunday_is_seven{false};
};

constexpr FieldSpec kMinute{.lo = 0, .hi = 59};
constexpr FieldSpec kHour{.lo = 0, .hi = 23};
constexpr FieldSpec kDom{.lo = 1, .hi = 31};
constexpr FieldSpec kMonth{.lo = 1, .hi = 12, .names = kMonths, .first_name = 1};
constexpr FieldSpec kDow{.lo = 0,
                         .hi = 6,
                         .names = kWeekdays,
                         .first_name = 0,
                         .sunday_is_seven = true};

auto span_mask(int from, int to, int step) -> std::uint64_t {
  std::uint64_t mask = 0;
  for (int v = from; v <= to; v += step) {
    mask |= std::uint64_t{1} << v;
  }
  return mask;
}

auto parse_value(std::string_view text, const FieldSpec &spec) -> Result<int> {
  if (auto n = util::parse_int<int>(text)) {
    const int top = spec.sunday_is_seven ? 7 : spec.hi;
    if (*n < spec.lo || *n > top) {
      return fail(Error::ParseError);
    }
    return ok(*n);
  }
  for (std::size_t i = 0; i < spec.names.size(); ++i) {
    if (boost::algorithm::iequals(text, spec.names[i])) {
      return ok(spec.first_name + static_cast<int>(i));
    }
  }
  return fail(Error::ParseError);
}

struct Term {
  std::uint64_t mask{0};
  bool wildcard{false};
};

// One comma-separated piece: `*`, `v`, `a-b`, each optionally `/step`.
// `v/step` runs from v to the top of the field.
auto parse_term(std::string_view text, const FieldSpec &spec) -> Result<Term> {
  int step = 1;
  bool stepped = false;
  if (auto slash = text.find('/'); slash != std::string_view::npos) {
    auto parsed = util::parse_int<int>(text.substr(slash + 1));
    if (!parsed || *parsed <= 0) {
      return fail(Error::ParseError);
    }
    step = *parsed;
    stepped = true;
    text = text.substr(0, slash);
  }

  const int top = spec.sunday_is_seven ? 7 : spec.hi;
  int from = spec.lo;
  int to = spec.hi;
  if (text == "*" || text == "?") {
    Term term{.mask = span_mask(from, to, step), .wildcard = !stepped};
    return ok(term);
  }
  if (auto dash = text.find('-'); dash != std::string_view::npos) {
    auto a = parse_value(text.substr(0, dash), spec);
    auto b = parse_value(text.substr(dash + 1), spec);
    if (!a || !b || *a > *b) {
      return fail(Error::ParseError);
    }
    from = *a;
    to = *b;
  } else {
    auto v = parse_value(text, spec);
    if (!v) {
      return fail(Error::ParseError);
    }
    from = *v;
    to = stepped ? top : *v;
  }

  auto mask = span_mask(from, to, step);
  if (spec.sunday_is_seven && (mask >> 7 & 1) != 0) {
    mask = (mask & ~(std::uint64_t{1} << 7)) | 1;
  }
  return ok(Term{.mask = mask});
}

struct Field {
  std::uint64_t mask{0};
  bool wildcard{false};
};

auto parse_field(std::string_view text, const FieldSpec &spec)
    -> Result<Field> {
  std::vector<std::string> terms;
  boost::algorithm::split(terms, text, boost::algorithm::is_any_of(","));
  Field field;
  for (const auto &term : terms) {
    if (term.empty()) {
      return fail(Error::ParseError);
    }
    auto parsed = parse_term(term, spec);
    if (!parsed) {
      return fail(parsed.error());
    }
    field.mask |= parsed->mask;
    field.wildcard = field.wildcard || parsed->wildcard;
  }
  return ok(field);
}

auto has(std::uint64_t mask, unsigned value) -> bool {
  return (mask >> value & 1) != 0;
}

} // namespace

auto CronExpr::parse(std::string_view expr) -> Result<CronExpr> {
  std::string text = boost::algorithm::trim_copy(std::string(expr));
  std::string_view body = text;
  if (body.starts_with('@')) {
    auto macro = std::ranges::find_if(kMacros, [&](const Macro &m) {
      return boost::algorithm::iequals(body, m.name);
    });
    if (macro == kMacros.end()) {
      return fail(Error::ParseError);
    }
    body = macro->expansion;
  }

  std::vector<std::string> fields;
  boost::algorithm::split(fields, body, boost::algorithm::is_space(),
                          boost::algorithm::token_compress_on);
  std::erase_if(fields, [](const std::string &f) { return f.empty(); });
  if (fields.size() != 5) {
    return fail(Error::ParseError);
  }

  const std::array<const FieldSpec *, 5> specs{&kMinute, &kHour, &kDom,
                                               &kMonth, &kDow};
  std::array<Field, 5> parsed{};
  for (std::size_t i = 0; i < specs.size(); ++i) {
    auto field = parse_field(fields[i], *specs[i]);
    if (!field) {
      return fail(field.error());
    }
    parsed[i] = *field;
  }

  Masks masks{.minute = parsed[0].mask,
              .hour = parsed[1].mask,
              .dom = parsed[2].mask,
              .month = parsed[3].mask,
              .dow = parsed[4].mask,
              .any_dom = parsed[2].wildcard,
              .any_dow = parsed[4].wildcard};
  return ok(CronExpr(std::move(text), masks));
}

auto CronExpr::matches(std::chrono::system_clock::time_point tp) const
    -> bool {
  using namespace std::chrono;
  const auto day = floor<days>(tp);
  const year_month_day date{day};
  const hh_mm_ss time{floor<minutes>(tp) - day};

  if (!has(masks_.minute, static_cast<unsigned>(time.minutes().count())) ||
      !has(masks_.hour, static_cast<unsigned>(time.hours().count())) ||
      !has(masks_.month, static_cast<unsigned>(date.month()))) {
    return false;
  }

  const bool dom_hit = has(masks_.dom, static_cast<unsigned>(date.day()));
  const bool dow_hit = has(masks_.dow, weekday{day}.c_encoding());
  // With both day fields restricted, either one may match.
  if (masks_.any_dom) {
    return dow_hit;
  }
  if (masks_.any_dow) {
    return dom_hit;
  }
  return dom_hit || dow_hit;
}

} // namespace flowcore
