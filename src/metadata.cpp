#include "metadata.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <yaml-cpp/yaml.h>     // JSON answers are parsed as YAML flow documents
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace Rampart {

    namespace {

        std::string requiredScalar(const YAML::Node& node, const char* key) {
            const YAML::Node value = node[key];
            if (!value || !value.IsScalar()) {
                throw ResolutionFailure(std::string("Malformed AUR response: result without '")
                                        + key + "'");
            }
            return value.as<std::string>();
        }

        std::vector<std::string> optionalList(const YAML::Node& node, const char* key) {
            std::vector<std::string> values;
            const YAML::Node list = node[key];
            if (!list || list.IsNull()) {
                return values;
            }
            if (!list.IsSequence()) {
                throw ResolutionFailure(std::string("Malformed AUR response: '")
                                        + key + "' is not a list");
            }
            for (const auto& item : list) {
                values.push_back(item.as<std::string>());
            }
            return values;
        }

    } // namespace

    std::vector<std::string> PackageInfo::allDependencies() const {
        std::vector<std::string> all;
        all.insert(all.end(), makeDepends.begin(), makeDepends.end());
        all.insert(all.end(), depends.begin(), depends.end());
        all.insert(all.end(), checkDepends.begin(), checkDepends.end());
        return all;
    }

    AurRpcClient::AurRpcClient(std::string rpcUrl, Fetcher fetcher)
        : rpcUrl_(std::move(rpcUrl)), fetcher_(std::move(fetcher)) {
        if (!fetcher_) {
            fetcher_ = [](const std::string& url) { return fetchUrl(url); };
        }
    }

    std::string AurRpcClient::buildInfoUrl(const std::string& rpcUrl,
                                           const std::vector<std::string>& names) {
        std::string url = rpcUrl + "?v=5&type=info";
        for (const auto& name : names) {
            url += "&arg[]=" + urlEncode(name);
        }
        return url;
    }

    std::vector<PackageInfo> AurRpcClient::parseInfoResponse(const std::string& body) {
        YAML::Node root;
        try {
            root = YAML::Load(body);
        } catch (const YAML::Exception& e) {
            throw ResolutionFailure(std::string("Malformed AUR response: ") + e.what());
        }

        if (!root || !root.IsMap()) {
            throw ResolutionFailure("Malformed AUR response: not a JSON object");
        }

        try {
            if (root["type"] && root["type"].IsScalar() &&
                root["type"].as<std::string>() == "error") {
                std::string reason = root["error"] && root["error"].IsScalar()
                                         ? root["error"].as<std::string>()
                                         : "unknown error";
                throw ResolutionFailure("AUR RPC returned an error: " + reason);
            }

            const YAML::Node results = root["results"];
            if (!results || !results.IsSequence()) {
                throw ResolutionFailure("Malformed AUR response: missing 'results'");
            }

            std::vector<PackageInfo> packages;
            for (const auto& node : results) {
                if (!node.IsMap()) {
                    throw ResolutionFailure("Malformed AUR response: result is not an object");
                }
                PackageInfo info;
                info.name         = requiredScalar(node, "Name");
                info.packageBase  = requiredScalar(node, "PackageBase");
                info.version      = requiredScalar(node, "Version");
                info.depends      = optionalList(node, "Depends");
                info.makeDepends  = optionalList(node, "MakeDepends");
                info.checkDepends = optionalList(node, "CheckDepends");
                packages.push_back(std::move(info));
            }
            return packages;
        } catch (const YAML::Exception& e) {
            throw ResolutionFailure(std::string("Malformed AUR response: ") + e.what());
        }
    }

    std::map<std::string, PackageInfo> AurRpcClient::info(const std::vector<std::string>& names) {
        std::map<std::string, PackageInfo> found;

        for (size_t start = 0; start < names.size(); start += kChunkSize) {
            size_t end = std::min(names.size(), start + kChunkSize);
            std::vector<std::string> chunk(names.begin() + start, names.begin() + end);

            std::string url = buildInfoUrl(rpcUrl_, chunk);
            log_debug("Fetching AUR information: " + url);

            std::string body;
            try {
                body = fetcher_(url);
            } catch (const std::runtime_error& e) {
                throw ResolutionFailure(std::string("Failed to fetch info from AUR, ") + e.what());
            }

            for (auto& package : parseInfoResponse(body)) {
                std::string name = package.name;
                found.emplace(std::move(name), std::move(package));
            }
        }
        return found;
    }

}
