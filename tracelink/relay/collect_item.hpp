// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include "collect_item.pb.h"

namespace tracelink {

using CollectItem = proto::CollectItem;

// Short name of the populated oneof, for log lines.
inline std::string_view item_kind(const CollectItem& item) {
    switch (item.item_case()) {
        case CollectItem::kSegment: return "segment";
        case CollectItem::kMeter: return "meter";
        case CollectItem::kLog: return "log";
        case CollectItem::kProperties: return "properties";
        case CollectItem::kPing: return "ping";
        case CollectItem::ITEM_NOT_SET: break;
    }
    return "empty";
}

}  // namespace tracelink
