// rvir/graph/describe.cpp - Short textual descriptions of values
#include "rvir/graph/describe.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <utility>
#include <vector>

#include "rvir/graph/node.hpp"
#include "rvir/graph/primitive.hpp"

namespace rvir
{

namespace
{

const char * logical_name(const Logical & l)
{
  static constexpr std::array<std::pair<LogicalOp, const char *>, 8> k_names = {{
    {LogicalOp::Id, "#id"},
    {LogicalOp::Not, "#not"},
    {LogicalOp::And, "#and"},
    {LogicalOp::Or, "#or"},
    {LogicalOp::Xor, "#xor"},
    {LogicalOp::Nand, "#nand"},
    {LogicalOp::Nor, "#nor"},
    {LogicalOp::Iff, "#iff"},
  }};
  for (const auto & [op, name] : k_names) {
    if (logical_table(op) == l) {
      return name;
    }
  }
  return nullptr;
}

class Describer
{
public:
  explicit Describer(int nesting) : nesting_(nesting) {}

  std::string operator()(const Parameter & p) const
  {
    return fmt::format("%{}.{}", p.region.depth(), p.index);
  }
  std::string operator()(const Application & a) const
  {
    return fmt::format("({})", list(a.args, " "));
  }
  std::string operator()(const Lambda & l) const
  {
    return fmt::format("#lambda({}) => {}", list(l.def_region.param_types(), ", "), sub(l.result));
  }
  std::string operator()(const Pi & p) const
  {
    return fmt::format("#pi({}) -> {}", list(p.def_region.param_types(), ", "), sub(p.result));
  }
  std::string operator()(const Tuple & t) const
  {
    return fmt::format("[{}]", list(t.elements, ", "));
  }
  std::string operator()(const Product & p) const
  {
    return fmt::format("#product[{}]", list(p.elements, ", "));
  }
  std::string operator()(const Ternary & t) const
  {
    return fmt::format("#ternary({}, {})", sub(t.high()), sub(t.low()));
  }
  std::string operator()(const BoolType &) const { return "#bool"; }
  std::string operator()(const Bool & b) const { return b.value ? "#true" : "#false"; }
  std::string operator()(const Finite & f) const { return fmt::format("#finite({})", f.size); }
  std::string operator()(const Index & ix) const
  {
    return fmt::format("#ix({})[{}]", ix.size, ix.index);
  }
  std::string operator()(const Logical & l) const
  {
    if (const char * name = logical_name(l)) {
      return name;
    }
    return fmt::format("#logical({}, {:#x})", l.arity, l.table);
  }
  std::string operator()(const Universe & u) const { return fmt::format("#universe({})", u.level); }

private:
  [[nodiscard]] std::string sub(const ValId & v) const { return describe(v, nesting_ - 1); }

  template <typename Range>
  [[nodiscard]] std::string list(const Range & values, const char * sep) const
  {
    std::vector<std::string> parts;
    for (const auto & v : values) {
      parts.push_back(sub(v));
    }
    return fmt::format("{}", fmt::join(parts, sep));
  }

  int nesting_;
};

}  // namespace

std::string describe(const ValId & value, int max_nesting)
{
  if (!value) {
    return "<none>";
  }
  if (max_nesting <= 0) {
    return "...";
  }
  return std::visit(Describer(max_nesting), value->data());
}

}  // namespace rvir
