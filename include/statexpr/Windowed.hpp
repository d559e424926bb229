// include/statexpr/Windowed.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "statexpr/Errors.hpp"
#include "statexpr/util/Logger.hpp"

namespace statexpr {

struct WindowOptions {
  std::size_t start = 0;              // source elements discarded up front
  std::size_t step  = 1;              // batch size
  std::optional<std::size_t> limit;   // stop pulling once this many elements (skipped ones included) were read
  std::size_t trim  = 0;              // trailing elements withheld from the output

  std::size_t capacity() const { return step + trim; }

  // Throws ConfigError for a zero step or a lookahead that does not fit
  // in a size_t.
  void validate() const {
    if (step == 0) throw ConfigError("window step must be at least 1");
    if (trim > std::numeric_limits<std::size_t>::max() - step)
      throw ConfigError("window step + trim is too large");
  }

  // Slice-style parameters: a non-negative stop is a limit, a negative
  // stop trims that many trailing elements.
  static WindowOptions fromSlice(std::size_t start, std::optional<long long> stop, std::size_t step) {
    WindowOptions o;
    o.start = start;
    o.step  = step;
    if (stop) {
      if (*stop >= 0) o.limit = static_cast<std::size_t>(*stop);
      else            o.trim  = static_cast<std::size_t>(0ULL - static_cast<unsigned long long>(*stop));
    }
    return o;
  }
};

// Pull source over an iterator range.
template <class It>
class RangeSource {
public:
  using value_type = typename std::iterator_traits<It>::value_type;

  RangeSource(It first, It last) : it_(first), end_(last) {}

  std::optional<value_type> next() {
    if (it_ == end_) return std::nullopt;
    return *it_++;
  }

private:
  It it_;
  It end_;
};

template <class Container>
RangeSource<typename Container::const_iterator> rangeSource(const Container& c) {
  return RangeSource<typename Container::const_iterator>(c.begin(), c.end());
}

// Pull source over a callable returning an empty optional at the end.
template <class T>
class FunctionSource {
public:
  using value_type = T;

  explicit FunctionSource(std::function<std::optional<T>()> fn) : fn_(std::move(fn)) {}

  std::optional<T> next() { return fn_(); }

private:
  std::function<std::optional<T>()> fn_;
};

/**
 * Groups a forward-only source into batches of `step` elements.
 *
 * A Source is anything with `value_type` and `std::optional<value_type> next()`
 * returning nullopt once exhausted; it is read strictly in order and at most
 * once per element.
 *
 * Elements are pulled into a lookahead buffer of `step + trim` elements. A
 * batch is released only when the buffer is full, which guarantees that at
 * least `trim` elements follow it. When the source runs dry (or `limit` is
 * reached) before the buffer fills, the stream terminates: the buffered
 * elements minus the `trim` newest ones are released as a final, possibly
 * short, batch, or nothing if no more than `trim` elements are buffered.
 * After that the source is dropped and next() keeps returning nullopt.
 *
 * Batches of a step of 1 hold exactly one element.
 */
template <class Source>
class WindowedStream {
public:
  using value_type = typename Source::value_type;
  using Batch      = std::vector<value_type>;

  enum class State { Skipping, Filling, Terminated };

  WindowedStream(Source source, WindowOptions opts)
    : source_(std::move(source)), opts_(std::move(opts))
  {
    opts_.validate();
    state_ = opts_.start > 0 ? State::Skipping : State::Filling;
  }

  std::optional<Batch> next() {
    if (!source_) return std::nullopt;

    while (consumed_ < opts_.start) {
      std::optional<value_type> v = source_->next();
      if (!v) {
        terminate();
        return std::nullopt;
      }
      ++consumed_;
    }
    state_ = State::Filling;

    const std::size_t cap = opts_.capacity();
    while (buffer_.size() < cap && belowLimit()) {
      std::optional<value_type> v = source_->next();
      if (!v) break;
      ++consumed_;
      buffer_.push_back(std::move(*v));
    }

    if (buffer_.size() < cap) {
      terminate();
      // step - (cap - buffered), without going below zero
      if (buffer_.size() + opts_.step <= cap) {
        buffer_.clear();
        return std::nullopt;
      }
      Batch out = take(buffer_.size() + opts_.step - cap);
      buffer_.clear();
      return out;
    }

    return take(opts_.step);
  }

  // Step-1 convenience: the element itself instead of a one-element batch.
  // Throws ConfigError for any other step.
  std::optional<value_type> nextOne() {
    if (opts_.step != 1) throw ConfigError("nextOne() needs a window step of 1");
    std::optional<Batch> b = next();
    if (!b) return std::nullopt;
    return std::move(b->front());
  }

  State state() const { return state_; }
  bool terminated() const { return state_ == State::Terminated; }
  std::size_t consumed() const { return consumed_; }
  std::size_t buffered() const { return buffer_.size(); }
  const WindowOptions& options() const { return opts_; }

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = Batch;
    using difference_type   = std::ptrdiff_t;
    using pointer           = Batch*;
    using reference         = Batch&;

    iterator() = default;
    explicit iterator(WindowedStream* s) : s_(s) { ++*this; }

    Batch& operator*() { return *cur_; }
    Batch* operator->() { return &*cur_; }

    iterator& operator++() {
      cur_ = s_->next();
      if (!cur_) s_ = nullptr;
      return *this;
    }

    bool operator==(const iterator& o) const { return s_ == o.s_; }
    bool operator!=(const iterator& o) const { return s_ != o.s_; }

  private:
    WindowedStream* s_ = nullptr;
    std::optional<Batch> cur_;
  };

  // Single pass: begin() resumes wherever the stream currently is.
  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

private:
  bool belowLimit() const { return !opts_.limit || consumed_ < *opts_.limit; }

  Batch take(std::size_t n) {
    Batch out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      out.push_back(std::move(buffer_.front()));
      buffer_.pop_front();
    }
    return out;
  }

  void terminate() {
    state_ = State::Terminated;
    source_.reset();

    auto& log = util::logger();
    if (log.enabled(util::LogLevel::Debug)) {
      log.log(util::LogLevel::Debug, "window stream terminated",
              {{"consumed", std::to_string(consumed_)},
               {"buffered", std::to_string(buffer_.size())}});
    }
  }

  std::optional<Source> source_;
  WindowOptions opts_;
  State state_ = State::Filling;
  std::size_t consumed_ = 0;
  std::deque<value_type> buffer_;
};

template <class Source>
WindowedStream<Source> windowed(Source source, WindowOptions opts) {
  return WindowedStream<Source>(std::move(source), std::move(opts));
}

} // namespace statexpr
