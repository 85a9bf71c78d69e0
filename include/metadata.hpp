#ifndef METADATA_HPP
#define METADATA_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace Rampart {

/**
 * @brief Remote metadata record of one target (split package).
 */
struct PackageInfo
{
    std::string name;
    std::string packageBase;
    std::string version;
    std::vector<std::string> depends;
    std::vector<std::string> makeDepends;
    std::vector<std::string> checkDepends;

    /**
     * @brief makedepends, depends and checkdepends, in that order.
     */
    std::vector<std::string> allDependencies() const;
};

/**
 * @class MetadataSource
 * @brief Remote registry answering "what is target X built from".
 */
class MetadataSource
{
public:
    virtual ~MetadataSource() = default;

    /**
     * @brief Looks up a batch of target names.
     *
     * Names the registry does not know are simply absent from the result.
     *
     * @throws ResolutionFailure if the registry is unreachable or its answer is malformed.
     */
    virtual std::map<std::string, PackageInfo> info(const std::vector<std::string>& names) = 0;
};

/**
 * @class AurRpcClient
 * @brief MetadataSource backed by the AUR RPC v5 "info" endpoint.
 */
class AurRpcClient : public MetadataSource
{
public:
    using Fetcher = std::function<std::string(const std::string& url)>;

    /**
     * @param rpcUrl  Endpoint base, e.g. "https://aur.archlinux.org/rpc/".
     * @param fetcher Transport; defaults to a libcurl GET.
     */
    explicit AurRpcClient(std::string rpcUrl, Fetcher fetcher = {});

    std::map<std::string, PackageInfo> info(const std::vector<std::string>& names) override;

    /**
     * @brief Maximum number of names sent in one request.
     */
    static constexpr size_t kChunkSize = 100;

    /**
     * @brief Builds the request URL for one chunk of names.
     */
    static std::string buildInfoUrl(const std::string& rpcUrl, const std::vector<std::string>& names);

    /**
     * @brief Parses an RPC response body.
     *
     * @throws ResolutionFailure on "type": "error" answers or malformed documents.
     */
    static std::vector<PackageInfo> parseInfoResponse(const std::string& body);

private:
    std::string rpcUrl_;
    Fetcher fetcher_;
};

} // namespace Rampart

#endif // METADATA_HPP
