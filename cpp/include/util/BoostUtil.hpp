#pragma once

#include "util/CppUtil.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <memory>
#include <ostream>
#include <string>

namespace boost_util {

/*
 * Returns the contents of the given file.
 *
 * Throws util::CleanException if the file does not exist or cannot be read, since that is almost
 * always a bad cmdline argument rather than a bug.
 */
std::string read_str_from_file(const boost::filesystem::path& filename);

namespace program_options {

/*
 * This class is a thin wrapper around boost::program_options::options_description. It aims to
 * provide a similar interface, with the added benefit that option-naming clashes are detected at
 * compile-time, rather than at runtime.
 *
 * Before:
 *
 * using namespace po = boost::program_options;
 * po::options_description desc("descr");
 * desc.add_options()
 *     ("foo,f", ...)
 *     ("bar", ...)
 *     ;
 * return desc;
 *
 * After:
 *
 * using namespace po2 = boost_util::program_options;
 * po2::options_description desc("descr");
 * return desc
 *     .add_option<"foo", 'f'>(...)
 *     .add_option<"bar">(...)
 *     ;
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = util::int_sequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;

  using base_t = boost::program_options::options_description;

  options_description(const char* name);

  /*
   * Similar to boost::program_options::options_description::add_options()(...), except that the
   * option name(s) is passed as a template argument, rather than as a function argument. This
   * allow for compile-time checking of name clashes.
   */
  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  /*
   * Adds both --foo and --no-foo options, both writing to *flag. The help text of the one matching
   * the current value of *flag is marked as a no-op.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  /*
   * Adds all options from desc to this.
   */
  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    return s << *desc.base_;
  }

  const base_t& get() const { return *base_; }
  base_t& get() { return *base_; }

 private:
  explicit options_description(std::shared_ptr<base_t> base) : base_(std::move(base)) {}

  template <util::StringLiteral StrLit, char Char = ' '>
  auto augment() const;

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  std::shared_ptr<base_t> base_;
  std::string tmp_str_;  // full "name,c" spelling produced by augment()
};

/*
 * Constructs a boost::program_options::command_line_parser out of ts, which is expected to be
 * a collection of strings from the command line. Uses this to store to the passed-in desc, which
 * should be a {boost, boost_util}::program_options::options_description. Returns the parsed
 * variables_map.
 *
 * Parse errors are rethrown as util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
