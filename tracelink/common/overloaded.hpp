// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace tracelink {

// Combines lambdas into a single visitor for `std::visit`:
//
//   std::visit(tracelink::overloaded{
//                  [](const CollectItem&) { ... },
//                  [](const EndOfStream&) { ... },
//                  [](const DecodeError&) { ... },
//              },
//              result);
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace tracelink
