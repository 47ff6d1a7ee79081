#pragma once

#include <string_view>

#include "internal/model/resolution.hpp"

namespace accessres::render {

// Whether the payload can be shown without leaving the host surface.
bool CanRenderInline(const accessres::model::AccessPayload& access);

// Call-to-action text for a payload, e.g. "Watch Live" or "Read Online".
std::string_view AccessLabel(const accessres::model::AccessPayload& access, accessres::model::ItemType item_type);

accessres::model::AccessAction ActionForItemType(accessres::model::ItemType item_type);

// Noun used in progress text ("Preparing live stream...").
std::string_view ItemTypeLabel(accessres::model::ItemType item_type);

} // namespace accessres::render
