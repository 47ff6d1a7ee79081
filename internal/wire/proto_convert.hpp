#pragma once

#include <optional>

#include "accessres/resolver/v1.hpp"
#include "internal/model/resolution.hpp"

namespace accessres::wire {

namespace v1 = accessres::resolver::v1;

// Manifest conversion fails for an unspecified mode, an unknown format or a
// manifest without the locator its mode requires.
std::optional<accessres::model::AccessPayload> ManifestFromProto(const v1::AccessManifest& manifest);
v1::AccessManifest                          ManifestToProto(const accessres::model::AccessPayload& payload);

std::optional<accessres::model::AccessResolution> ResolutionFromProto(const v1::AccessResolution& resolution);
v1::AccessResolution                           ResolutionToProto(const accessres::model::AccessResolution& resolution);

std::optional<accessres::model::GradedResolution> GradedFromProto(const v1::GradedAccessResolution& graded);
v1::GradedAccessResolution                     GradedToProto(const accessres::model::GradedResolution& graded);

std::optional<accessres::model::BatchAccessResult> BatchResultFromProto(const v1::BatchAccessResult& result);
v1::BatchAccessResult                           BatchResultToProto(const accessres::model::BatchAccessResult& result);

v1::BatchPriority PriorityToProto(accessres::model::BatchPriority priority);
v1::AccessReceipt ReceiptToProto(const accessres::model::AccessReceipt& receipt);

} // namespace accessres::wire
