// Copyright 2025 Google LLC.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef RELAYER_LIB_REGEX_NFA_H_
#define RELAYER_LIB_REGEX_NFA_H_

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "regex/regex_parser.h"
#include "util/status.h"

namespace relayer {

enum NfaStateKind {
  NFA_BYTE,     // consumes one byte in `bytes`, then goes to out
  NFA_EPSILON,  // goes to out and, if set, out1
  NFA_BEGIN,    // goes to out at position 0 only
  NFA_END,      // goes to out at the end of the text only
  NFA_MATCH,
};

struct NfaState {
  NfaStateKind kind = NFA_EPSILON;
  std::bitset<256> bytes;
  int out = -1;
  int out1 = -1;
};

constexpr size_t kMaxNfaStates = 1 << 20;

// Thompson automaton over bytes for a sequence of regex fragments.  Each
// fragment i is entered through the epsilon state entry(i); entry(k) for k
// fragments is the match state.  Simulation keeps sets of states, so every
// operation is linear in the text length times the automaton size.
class Nfa {
 public:
  Nfa() = default;

  bool Build(const std::vector<const RegexNode*>& parts, RelayerError* err);

  size_t num_parts() const { return entries_.size() - 1; }
  size_t num_states() const { return states_.size(); }
  int entry(size_t part) const { return entries_[part]; }
  const NfaState& state(int i) const { return states_[i]; }

  // Leftmost-longest match of the whole fragment sequence: the smallest
  // start at which any match exists, then the largest end for that start.
  bool FindLongest(const uint8_t text[/*n*/], size_t n, size_t* start,
                   size_t* end) const;

  // Splits the match [start, end) into fragment boundaries b[0] = start <=
  // b[1] <= ... <= b[k] = end.  Fragments are resolved in order, each taking
  // the longest prefix of the remainder that still lets the later
  // fragments match the rest exactly.
  bool Attribute(const uint8_t text[/*n*/], size_t n, size_t start,
                 size_t end, std::vector<size_t>* bounds) const;

 private:
  struct Frag {
    int start;
    std::vector<std::pair<int, int>> outs;  // (state, 0 for out / 1 for out1)
  };

  // Sparse state set remembering, per state, the start of the thread that
  // first reached it.
  class StateSet {
   public:
    explicit StateSet(size_t n) : where_(n, 0), start_(n, 0) {}
    bool contains(int q) const {
      size_t w = where_[q];
      return w < dense_.size() && dense_[w] == q;
    }
    void insert(int q, size_t start) {
      where_[q] = dense_.size();
      dense_.push_back(q);
      start_[q] = start;
    }
    void clear() { dense_.clear(); }
    bool empty() const { return dense_.empty(); }
    const std::vector<int>& members() const { return dense_; }
    size_t start_of(int q) const { return start_[q]; }

   private:
    std::vector<int> dense_;
    std::vector<size_t> where_;
    std::vector<size_t> start_;
  };

  int new_state(NfaStateKind kind);
  void patch(const std::vector<std::pair<int, int>>& outs, int target);
  Frag compile(const RegexNode& node);

  // Adds s and everything reachable from it without consuming input at
  // position pos.  Expansion stops at `stop` when it is non-negative.
  void add_forward(StateSet& set, int s, size_t pos, size_t n, size_t start,
                   int stop, std::vector<int>& stack) const;
  // Adds every state with an epsilon path into s at position pos.
  void add_backward(StateSet& set, int s, size_t pos, size_t n,
                    std::vector<int>& stack) const;

  std::vector<NfaState> states_;
  std::vector<std::vector<int>> rev_;
  std::vector<int> entries_;
  bool too_large_ = false;
};

}  // namespace relayer

#endif  // RELAYER_LIB_REGEX_NFA_H_
