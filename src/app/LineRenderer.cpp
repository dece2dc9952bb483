#include "app/LineRenderer.hpp"

namespace {

// Metric names and values may not carry the block separators.
void append_token(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '|' || c == ';' || c == '=') out += '_';
    else out += c;
  }
}

void append_text(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\n' || c == '\r' || c == '\t') out += ' ';
    else out += c;
  }
}

void append_metric(std::string& out, const zfscheck::model::Metric& m) {
  append_token(out, m.name);  out += '=';  append_token(out, m.value);
  if (m.warn.empty() && m.crit.empty()) return;
  out += ';';  append_token(out, m.warn);
  if (m.crit.empty()) return;
  out += ';';  append_token(out, m.crit);
}

} // anonymous namespace

namespace zfscheck::app {

std::string render_line(const model::AggregateResult& r) {
  std::string out;
  out += std::to_string(model::to_wire(r.severity));
  out += ' ';
  append_token(out, r.label);  out += ':';  append_token(out, r.entity);
  out += ' ';
  if (r.metrics.empty()) {
    out += '-';
  } else {
    for (size_t i = 0; i < r.metrics.size(); ++i) {
      if (i) out += '|';
      append_metric(out, r.metrics[i]);
    }
  }
  out += ' ';
  append_text(out, r.message);
  return out;
}

std::string render_failure(std::string_view label, std::string_view message) {
  std::string out = std::to_string(model::to_wire(model::Severity::Unknown));
  out += ' ';  append_token(out, label);
  out += " - ";  append_text(out, message);
  return out;
}

} // namespace zfscheck::app
