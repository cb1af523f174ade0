/*
 * StrideGraph - Architecture Threat Modeling Engine
 * Copyright (C) 2026 StrideGraph Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include "pch.h"
#include "DetectionLoader.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace StrideGraph::Pipeline {

    using Utils::JSON::Json;

    namespace {

        void SetError(DetectionLoadError* err, std::string message, std::optional<size_t> index = std::nullopt) {
            if (err) {
                err->message = std::move(message);
                err->detectionIndex = index;
            }
        }

        [[nodiscard]] bool ReadDimension(const Json& image, const char* key, uint32_t& out, DetectionLoadError* err) {
            const auto it = image.find(key);
            if (it == image.end() || !it->is_number_integer() || it->get<int64_t>() < 0 ||
                it->get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
                SetError(err, std::string("image.") + key + " must be a non-negative integer");
                return false;
            }
            out = static_cast<uint32_t>(it->get<int64_t>());
            return true;
        }

        [[nodiscard]] bool ReadBox(const Json& bbox, Model::BoundingBox& out) {
            if (bbox.is_array()) {
                if (bbox.size() != 4) {
                    return false;
                }
                for (const auto& v : bbox) {
                    if (!v.is_number()) {
                        return false;
                    }
                }
                out = { bbox[0].get<double>(), bbox[1].get<double>(), bbox[2].get<double>(), bbox[3].get<double>() };
                return true;
            }

            if (bbox.is_object()) {
                const char* keys[] = { "x", "y", "width", "height" };
                double values[4] = {};
                for (size_t k = 0; k < 4; ++k) {
                    const auto it = bbox.find(keys[k]);
                    if (it == bbox.end() || !it->is_number()) {
                        return false;
                    }
                    values[k] = it->get<double>();
                }
                out = { values[0], values[1], values[2], values[3] };
                return true;
            }
            return false;
        }

    }  // namespace

    std::string DetectionLoadError::ToString() const {
        std::string s;
        if (!path.empty()) {
            s += path.string() + ": ";
        }
        s += message;
        return s;
    }

    bool DetectionsFromJson(const Json& j, DetectionInput& out, DetectionLoadError* err) noexcept {
        try {
            if (!j.is_object()) {
                SetError(err, "detection document root must be a JSON object");
                return false;
            }

            DetectionInput input;

            if (const auto it = j.find("source"); it != j.end()) {
                if (!it->is_string()) {
                    SetError(err, "'source' must be a string");
                    return false;
                }
                input.source = it->get<std::string>();
            }

            const auto imageIt = j.find("image");
            if (imageIt == j.end() || !imageIt->is_object()) {
                SetError(err, "'image' object with width and height is required");
                return false;
            }
            if (!ReadDimension(*imageIt, "width", input.image.width, err) ||
                !ReadDimension(*imageIt, "height", input.image.height, err)) {
                return false;
            }

            bool normalizedUnits = false;
            if (const auto it = j.find("units"); it != j.end()) {
                const std::string units = it->is_string() ? Utils::StringUtils::ToLower(it->get<std::string>()) : "";
                if (units == "normalized") {
                    normalizedUnits = true;
                }
                else if (units != "pixels") {
                    SetError(err, "'units' must be \"pixels\" or \"normalized\"");
                    return false;
                }
            }

            const auto detIt = j.find("detections");
            if (detIt == j.end() || !detIt->is_array()) {
                SetError(err, "'detections' array is required");
                return false;
            }

            input.detections.reserve(detIt->size());
            size_t index = 0;
            for (const Json& d : *detIt) {
                if (!d.is_object()) {
                    SetError(err, "detection #" + std::to_string(index) + " must be an object", index);
                    return false;
                }

                Model::RawDetection det;

                if (const auto it = d.find("label"); it != d.end()) {
                    if (!it->is_string()) {
                        SetError(err, "detection #" + std::to_string(index) + ": 'label' must be a string", index);
                        return false;
                    }
                    det.label = it->get<std::string>();
                }

                const auto confIt = d.find("confidence");
                if (confIt == d.end() || !confIt->is_number()) {
                    SetError(err, "detection #" + std::to_string(index) + ": numeric 'confidence' is required", index);
                    return false;
                }
                det.confidence = confIt->get<double>();

                const auto boxIt = d.find("bbox");
                if (boxIt == d.end() || !ReadBox(*boxIt, det.box)) {
                    SetError(err, "detection #" + std::to_string(index) +
                                  ": 'bbox' must be [x, y, width, height] or an object with those keys", index);
                    return false;
                }

                if (normalizedUnits) {
                    det.box.x *= input.image.width;
                    det.box.y *= input.image.height;
                    det.box.width *= input.image.width;
                    det.box.height *= input.image.height;
                }

                input.detections.push_back(std::move(det));
                ++index;
            }

            out = std::move(input);
            return true;
        }
        catch (const std::exception& e) {
            SetError(err, std::string("detection document: ") + e.what());
            return false;
        }
    }

    bool LoadDetectionsFromFile(const std::filesystem::path& path, DetectionInput& out, DetectionLoadError* err) noexcept {
        Json j;
        Utils::JSON::Error jsonErr;
        if (!Utils::JSON::LoadFromFile(path, j, &jsonErr)) {
            if (err) {
                err->message = "cannot load detections: " + jsonErr.message;
                err->path = path;
                err->detectionIndex.reset();
            }
            SG_LOG_ERROR("Detections", "Failed to load %s: %s", path.string().c_str(), jsonErr.message.c_str());
            return false;
        }

        DetectionLoadError localErr;
        if (!DetectionsFromJson(j, out, &localErr)) {
            localErr.path = path;
            SG_LOG_ERROR("Detections", "Invalid detection file %s: %s", path.string().c_str(), localErr.message.c_str());
            if (err) {
                *err = std::move(localErr);
            }
            return false;
        }

        if (out.source.empty()) {
            out.source = path.filename().string();
        }

        SG_LOG_DEBUG("Detections", "Loaded %zu detections (%ux%u) from %s",
                     out.detections.size(), out.image.width, out.image.height, path.string().c_str());
        return true;
    }

} // namespace StrideGraph::Pipeline
