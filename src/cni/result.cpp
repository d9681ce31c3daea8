/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>

#include "genie/cni/result.hpp"
#include "genie/common/utils/json.hpp"

#include "log.hpp"

namespace genie::cni {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

Interface InterfaceFromJSON(const Json::Value& object)
{
    return {common::utils::GetString(object, "name"), common::utils::GetString(object, "mac"),
        common::utils::GetString(object, "sandbox")};
}

IPs IPsFromJSON(const Json::Value& object)
{
    return {common::utils::GetString(object, "version"), common::utils::GetInt(object, "interface", -1),
        common::utils::GetString(object, "address"), common::utils::GetString(object, "gateway")};
}

Route RouteFromJSON(const Json::Value& object)
{
    return {common::utils::GetString(object, "dst"), common::utils::GetString(object, "gw")};
}

DNS DNSFromJSON(const Json::Value& object)
{
    DNS dns;

    dns.mNameservers = common::utils::GetStringArray(object, "nameservers");
    dns.mDomain      = common::utils::GetString(object, "domain");
    dns.mSearch      = common::utils::GetStringArray(object, "search");
    dns.mOptions     = common::utils::GetStringArray(object, "options");

    return dns;
}

bool IsLegacyResult(const Json::Value& json)
{
    auto version = common::utils::GetString(json, "cniVersion");

    if (version == "0.1.0" || version == "0.2.0") {
        return true;
    }

    return !json.isMember("ips") && (json.isMember("ip4") || json.isMember("ip6"));
}

void ConvertLegacyIPConfig(const Json::Value& json, const char* key, const std::string& ipVersion, Result& result)
{
    if (!json.isMember(key) || !json[key].isObject()) {
        return;
    }

    const auto& ipConfig = json[key];

    result.mIPs.push_back({ipVersion, -1, common::utils::GetString(ipConfig, "ip"),
        common::utils::GetString(ipConfig, "gateway")});

    auto routes = common::utils::GetArrayValue<Route>(ipConfig, "routes", RouteFromJSON);

    result.mRoutes.insert(result.mRoutes.end(), routes.begin(), routes.end());
}

Json::Value DNSToJSON(const DNS& dns)
{
    Json::Value object(Json::objectValue);

    if (!dns.mNameservers.empty()) {
        object["nameservers"] = common::utils::ToJsonArray(dns.mNameservers);
    }

    if (!dns.mDomain.empty()) {
        object["domain"] = dns.mDomain;
    }

    if (!dns.mSearch.empty()) {
        object["search"] = common::utils::ToJsonArray(dns.mSearch);
    }

    if (!dns.mOptions.empty()) {
        object["options"] = common::utils::ToJsonArray(dns.mOptions);
    }

    return object;
}

// Since 1.0.0 the IP version is derived from the address.
bool HasIPVersionField(const std::string& cniVersion)
{
    auto  major = cniVersion.substr(0, cniVersion.find('.'));
    char* end   = nullptr;
    auto  value = std::strtol(major.c_str(), &end, 10);

    if (major.empty() || *end != '\0') {
        return true;
    }

    return value < 1;
}

std::string GetIPVersion(const IPs& ip)
{
    if (!ip.mVersion.empty()) {
        return ip.mVersion;
    }

    return ip.mAddress.find(':') != std::string::npos ? "6" : "4";
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ParseResult(const Json::Value& json, Result& result)
{
    if (!json.isObject()) {
        return Error(ErrorEnum::eInvalidArgument, "result is not an object");
    }

    result          = Result();
    result.mVersion = common::utils::GetString(json, "cniVersion");

    if (IsLegacyResult(json)) {
        LOG_DBG() << "Convert legacy result" << Log::Field("version", result.mVersion);

        ConvertLegacyIPConfig(json, "ip4", "4", result);
        ConvertLegacyIPConfig(json, "ip6", "6", result);
    } else {
        result.mInterfaces = common::utils::GetArrayValue<Interface>(json, "interfaces", InterfaceFromJSON);
        result.mIPs        = common::utils::GetArrayValue<IPs>(json, "ips", IPsFromJSON);
        result.mRoutes     = common::utils::GetArrayValue<Route>(json, "routes", RouteFromJSON);
    }

    if (json.isMember("dns") && json["dns"].isObject()) {
        result.mDNS = DNSFromJSON(json["dns"]);
    }

    return ErrorEnum::eNone;
}

Error ParseResult(const std::string& data, Result& result)
{
    auto [json, err] = common::utils::ParseJson(data);
    if (!err.IsNone()) {
        return err;
    }

    return ParseResult(json, result);
}

Json::Value ResultToJSON(const Result& result, const std::string& version)
{
    Json::Value json(Json::objectValue);

    json["cniVersion"] = version.empty() ? result.mVersion : version;

    auto withIPVersion = HasIPVersionField(json["cniVersion"].asString());

    if (!result.mInterfaces.empty()) {
        auto& interfaces = json["interfaces"] = Json::Value(Json::arrayValue);

        for (const auto& iface : result.mInterfaces) {
            Json::Value object(Json::objectValue);

            object["name"] = iface.mName;

            if (!iface.mMac.empty()) {
                object["mac"] = iface.mMac;
            }

            if (!iface.mSandbox.empty()) {
                object["sandbox"] = iface.mSandbox;
            }

            interfaces.append(object);
        }
    }

    if (!result.mIPs.empty()) {
        auto& ips = json["ips"] = Json::Value(Json::arrayValue);

        for (const auto& ip : result.mIPs) {
            Json::Value object(Json::objectValue);

            if (withIPVersion) {
                object["version"] = GetIPVersion(ip);
            }

            object["address"] = ip.mAddress;

            if (!ip.mGateway.empty()) {
                object["gateway"] = ip.mGateway;
            }

            if (ip.mInterface >= 0) {
                object["interface"] = ip.mInterface;
            }

            ips.append(object);
        }
    }

    if (!result.mRoutes.empty()) {
        auto& routes = json["routes"] = Json::Value(Json::arrayValue);

        for (const auto& route : result.mRoutes) {
            Json::Value object(Json::objectValue);

            object["dst"] = route.mDst;

            if (!route.mGW.empty()) {
                object["gw"] = route.mGW;
            }

            routes.append(object);
        }
    }

    json["dns"] = DNSToJSON(result.mDNS);

    return json;
}

bool ParseErrorObject(const Json::Value& json, int& code, std::string& message)
{
    if (!json.isObject() || !json.isMember("code") || !json["code"].isIntegral()) {
        return false;
    }

    code    = json["code"].asInt();
    message = common::utils::GetString(json, "msg");

    if (auto details = common::utils::GetString(json, "details"); !details.empty()) {
        message.append("; ").append(details);
    }

    return true;
}

Json::Value ErrorToJSON(const std::string& version, int code, const std::string& message)
{
    Json::Value json(Json::objectValue);

    json["cniVersion"] = version;
    json["code"]       = code;
    json["msg"]        = message;

    return json;
}

} // namespace genie::cni
