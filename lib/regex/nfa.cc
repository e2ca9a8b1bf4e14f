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

#include "regex/nfa.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "regex/regex_parser.h"
#include "util/panic.h"
#include "util/status.h"

namespace relayer {

int Nfa::new_state(NfaStateKind kind) {
  if (states_.size() >= kMaxNfaStates) {
    // Later states alias state 0; Build() reports the overflow.
    too_large_ = true;
    return 0;
  }
  states_.emplace_back();
  states_.back().kind = kind;
  return static_cast<int>(states_.size() - 1);
}

void Nfa::patch(const std::vector<std::pair<int, int>>& outs, int target) {
  for (const auto& o : outs) {
    if (o.second == 0) {
      states_[o.first].out = target;
    } else {
      states_[o.first].out1 = target;
    }
  }
}

Nfa::Frag Nfa::compile(const RegexNode& node) {
  if (too_large_) {
    return Frag{0, {}};
  }
  switch (node.kind) {
    case REGEX_EMPTY: {
      int s = new_state(NFA_EPSILON);
      return Frag{s, {{s, 0}}};
    }
    case REGEX_BYTES: {
      int s = new_state(NFA_BYTE);
      states_[s].bytes = node.bytes;
      return Frag{s, {{s, 0}}};
    }
    case REGEX_BEGIN: {
      int s = new_state(NFA_BEGIN);
      return Frag{s, {{s, 0}}};
    }
    case REGEX_END: {
      int s = new_state(NFA_END);
      return Frag{s, {{s, 0}}};
    }
    case REGEX_CONCAT: {
      Frag f = compile(*node.children[0]);
      for (size_t i = 1; i < node.children.size(); ++i) {
        Frag g = compile(*node.children[i]);
        patch(f.outs, g.start);
        f.outs = std::move(g.outs);
      }
      return f;
    }
    case REGEX_ALT: {
      std::vector<Frag> frags;
      for (const auto& c : node.children) {
        frags.push_back(compile(*c));
      }
      Frag r = std::move(frags.back());
      for (size_t i = frags.size() - 1; i-- > 0;) {
        int s = new_state(NFA_EPSILON);
        states_[s].out = frags[i].start;
        states_[s].out1 = r.start;
        std::vector<std::pair<int, int>> outs = std::move(frags[i].outs);
        outs.insert(outs.end(), r.outs.begin(), r.outs.end());
        r = Frag{s, std::move(outs)};
      }
      return r;
    }
    case REGEX_REPEAT: {
      const RegexNode& child = *node.children[0];
      int e = new_state(NFA_EPSILON);
      Frag f{e, {{e, 0}}};
      for (int i = 0; i < node.min; ++i) {
        Frag g = compile(child);
        patch(f.outs, g.start);
        f.outs = std::move(g.outs);
      }
      if (node.max == kRegexUnbounded) {
        int s = new_state(NFA_EPSILON);
        Frag g = compile(child);
        states_[s].out = g.start;
        patch(g.outs, s);
        patch(f.outs, s);
        f.outs = {{s, 1}};
      } else {
        for (int i = node.min; i < node.max; ++i) {
          int s = new_state(NFA_EPSILON);
          Frag g = compile(child);
          states_[s].out = g.start;
          patch(f.outs, s);
          f.outs = std::move(g.outs);
          f.outs.push_back({s, 1});
        }
      }
      return f;
    }
  }
  fail("unknown regex node kind %d", static_cast<int>(node.kind));
}

bool Nfa::Build(const std::vector<const RegexNode*>& parts,
                RelayerError* err) {
  states_.clear();
  entries_.clear();
  too_large_ = false;
  if (parts.empty()) {
    return set_error(err, RELAYER_INVALID_REGEX,
                     "Regex error: no regex fragments");
  }
  for (size_t i = 0; i < parts.size(); ++i) {
    entries_.push_back(new_state(NFA_EPSILON));
  }
  entries_.push_back(new_state(NFA_MATCH));
  for (size_t i = 0; i < parts.size(); ++i) {
    Frag f = compile(*parts[i]);
    states_[entries_[i]].out = f.start;
    patch(f.outs, entries_[i + 1]);
  }
  if (too_large_) {
    return set_error(err, RELAYER_INVALID_REGEX,
                     "Regex error: automaton exceeds " +
                         std::to_string(kMaxNfaStates) + " states");
  }

  rev_.assign(states_.size(), std::vector<int>());
  for (size_t q = 0; q < states_.size(); ++q) {
    const NfaState& st = states_[q];
    if (st.out >= 0) rev_[st.out].push_back(static_cast<int>(q));
    if (st.out1 >= 0) rev_[st.out1].push_back(static_cast<int>(q));
  }
  return true;
}

void Nfa::add_forward(StateSet& set, int s, size_t pos, size_t n,
                      size_t start, int stop, std::vector<int>& stack) const {
  stack.clear();
  stack.push_back(s);
  while (!stack.empty()) {
    int q = stack.back();
    stack.pop_back();
    if (q < 0 || set.contains(q)) continue;
    set.insert(q, start);
    if (q == stop) continue;
    const NfaState& st = states_[q];
    switch (st.kind) {
      case NFA_EPSILON:
        stack.push_back(st.out1);
        stack.push_back(st.out);
        break;
      case NFA_BEGIN:
        if (pos == 0) stack.push_back(st.out);
        break;
      case NFA_END:
        if (pos == n) stack.push_back(st.out);
        break;
      case NFA_BYTE:
      case NFA_MATCH:
        break;
    }
  }
}

void Nfa::add_backward(StateSet& set, int s, size_t pos, size_t n,
                       std::vector<int>& stack) const {
  stack.clear();
  stack.push_back(s);
  while (!stack.empty()) {
    int t = stack.back();
    stack.pop_back();
    if (set.contains(t)) continue;
    set.insert(t, 0);
    for (int q : rev_[t]) {
      const NfaState& st = states_[q];
      if (st.kind == NFA_EPSILON || (st.kind == NFA_BEGIN && pos == 0) ||
          (st.kind == NFA_END && pos == n)) {
        stack.push_back(q);
      }
    }
  }
}

bool Nfa::FindLongest(const uint8_t text[/*n*/], size_t n, size_t* start,
                      size_t* end) const {
  const int match = entries_.back();
  StateSet cur(states_.size()), next(states_.size());
  std::vector<int> stack;
  bool found = false;
  size_t best_s = 0, best_e = 0;

  for (size_t pos = 0;; ++pos) {
    // Threads are inserted in order of increasing start, so the first
    // thread to reach a state carries the leftmost start.
    if (!found) {
      add_forward(cur, entries_[0], pos, n, pos, -1, stack);
    }
    for (int q : cur.members()) {
      if (q == match) {
        size_t s = cur.start_of(q);
        if (!found || s < best_s || (s == best_s && pos > best_e)) {
          found = true;
          best_s = s;
          best_e = pos;
        }
      }
    }
    if (pos == n) break;

    next.clear();
    const uint8_t c = text[pos];
    for (int q : cur.members()) {
      const NfaState& st = states_[q];
      if (st.kind != NFA_BYTE || !st.bytes.test(c)) continue;
      size_t s = cur.start_of(q);
      if (found && s > best_s) continue;
      if (!next.contains(st.out)) {
        add_forward(next, st.out, pos + 1, n, s, -1, stack);
      }
    }
    std::swap(cur, next);
    if (found && cur.empty()) break;
  }
  if (found) {
    *start = best_s;
    *end = best_e;
  }
  return found;
}

bool Nfa::Attribute(const uint8_t text[/*n*/], size_t n, size_t start,
                    size_t end, std::vector<size_t>* bounds) const {
  const size_t k = num_parts();
  const size_t len = end - start;
  std::vector<int> stack;

  // reach[i][p - start]: text[p, end) is matched by fragments i..k-1.
  std::vector<std::vector<bool>> reach(k + 1, std::vector<bool>(len + 1));
  {
    StateSet cur(states_.size()), prev(states_.size());
    add_backward(cur, entries_[k], end, n, stack);
    for (size_t p = end;; --p) {
      for (size_t i = 0; i <= k; ++i) {
        if (cur.contains(entries_[i])) reach[i][p - start] = true;
      }
      if (p == start || cur.empty()) break;
      prev.clear();
      const uint8_t c = text[p - 1];
      for (int t : cur.members()) {
        for (int q : rev_[t]) {
          const NfaState& st = states_[q];
          if (st.kind == NFA_BYTE && st.bytes.test(c) && !prev.contains(q)) {
            add_backward(prev, q, p - 1, n, stack);
          }
        }
      }
      std::swap(cur, prev);
    }
  }
  if (!reach[0][0]) {
    return false;
  }

  bounds->assign(k + 1, start);
  (*bounds)[k] = end;
  size_t b = start;
  StateSet cur(states_.size()), next(states_.size());
  for (size_t i = 0; i < k; ++i) {
    const int stop = entries_[i + 1];
    bool have = false;
    size_t best = b;
    cur.clear();
    add_forward(cur, entries_[i], b, n, b, stop, stack);
    for (size_t p = b;; ++p) {
      if (cur.contains(stop) && reach[i + 1][p - start]) {
        have = true;
        best = p;
      }
      if (p == end || cur.empty()) break;
      next.clear();
      const uint8_t c = text[p];
      for (int q : cur.members()) {
        const NfaState& st = states_[q];
        if (st.kind == NFA_BYTE && st.bytes.test(c) &&
            !next.contains(st.out)) {
          add_forward(next, st.out, p + 1, n, b, stop, stack);
        }
      }
      std::swap(cur, next);
    }
    check(have, "fragment boundary lost during attribution");
    (*bounds)[i + 1] = best;
    b = best;
  }
  return true;
}

}  // namespace relayer
