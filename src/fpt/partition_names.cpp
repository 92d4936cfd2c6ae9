#include "mefw/fpt.hpp"

#include <unordered_map>

namespace mefw {

// see TR17_ME11_Static (Troopers 17) for the partition roles
KnownPartition describe_partition(const std::string& name) {
    static const std::unordered_map<std::string, KnownPartition> known = {
        {"FTPR", {PartitionType::Code, "Main code partition"}},
        {"FTUP", {PartitionType::Code, "[NFTP]+[WCOD]+[LOCL]"}},
        {"DLMP", {PartitionType::Code, "IDLM partition"}},
        {"PSVN", {PartitionType::Data, "Secure Version Number"}},
        {"IVBP", {PartitionType::Data, "IV + Bring Up cache"}},
        {"MFS", {PartitionType::Data, "ME Flash File System"}},
        {"NFTP", {PartitionType::Code, "Additional code"}},
        {"ROMB", {PartitionType::Code, "ROM Bypass"}},
        {"WCOD", {PartitionType::Code, "WLAN uCode"}},
        {"LOCL", {PartitionType::Code, "AMT Localization"}},
        {"FLOG", {PartitionType::Data, "Flash Log"}},
        {"UTOK", {PartitionType::Data, "Debug Unlock Token"}},
        {"ISHC", {PartitionType::Code, "Integrated Sensors Hub"}},
        {"AFSP", {PartitionType::None, "8778 55aa signature like MFS"}},
        {"FTPM", {PartitionType::Code, "Firmware TPM (unconfirmed)"}},
        {"GLUT", {PartitionType::Data, "Huffman Look-Up Table"}},
        {"EFFS", {PartitionType::Data, "EFFS File System"}},
        {"FOVD", {PartitionType::Data, "FOVD..."}},
    };

    auto it = known.find(name);
    if (it != known.end()) {
        return it->second;
    }
    return KnownPartition{PartitionType::None, "unknown"};
}

} // namespace mefw
