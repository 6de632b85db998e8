#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/StringUtils.hpp"

/**
 * @brief 区域（树形结构，通过 parentId 组织）
 */
struct Area {
    std::string id;
    std::string name;
    std::string parentId;  // 空表示根节点

    static Area create(std::string name, std::string parentId = "") {
        Area area;
        area.id = drogon::utils::getUuid();
        area.name = std::move(name);
        area.parentId = std::move(parentId);
        return area;
    }

    void validate() const {
        if (StringUtils::trim(name).empty()) {
            throw ValidationException("区域名称不能为空");
        }
        if (!parentId.empty() && parentId == id) {
            throw ValidationException("区域不能以自身为父节点");
        }
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id;
        json["name"] = name;
        json["parent_id"] = parentId.empty() ? Json::Value(Json::nullValue) : Json::Value(parentId);
        return json;
    }
};
