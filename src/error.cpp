// busq++ contributors

#include <busq++/error.hpp>

namespace Busq {

namespace {

struct KindName {
    int32_t     code;
    const char* name;
};

constexpr KindName kMobileDevice[] = {
    {-1, "InvalidArgument"},
    {-2, "Unknown"},
    {-3, "NoDevice"},
    {-4, "NotEnoughData"},
    {-5, "SslError"},
    {-6, "Timeout"},
    {100, "DeallocatedDevice"},
    {101, "Disconnected"},
};

constexpr KindName kPlist[] = {
    {-1, "InvalidArgument"},
    {-2, "FormatError"},
    {-3, "ParseError"},
    {-4, "NoMemory"},
    {-5, "IoError"},
    {-255, "Unknown"},
};

constexpr KindName kLockdown[] = {
    {-1, "InvalidArgument"},
    {-2, "InvalidConfiguration"},
    {-3, "PlistError"},
    {-4, "PairingFailed"},
    {-5, "SslError"},
    {-6, "DictError"},
    {-7, "ReceiveTimeout"},
    {-8, "MuxError"},
    {-9, "NoRunningSession"},
    {-10, "InvalidResponse"},
    {-11, "MissingKey"},
    {-12, "MissingValue"},
    {-13, "GetProhibited"},
    {-14, "SetProhibited"},
    {-15, "RemoveProhibited"},
    {-16, "ImmutableValue"},
    {-17, "PasswordProtected"},
    {-18, "UserDeniedPairing"},
    {-19, "PairingDialogResponsePending"},
    {-20, "MissingHostID"},
    {-21, "InvalidHostID"},
    {-22, "SessionActive"},
    {-23, "SessionInactive"},
    {-24, "MissingSessionID"},
    {-25, "InvalidSessionID"},
    {-26, "MissingService"},
    {-27, "InvalidService"},
    {-28, "ServiceLimit"},
    {-29, "MissingPairRecord"},
    {-30, "SavePairRecordFailed"},
    {-31, "InvalidPairRecord"},
    {-32, "InvalidActivationRecord"},
    {-33, "MissingActivationRecord"},
    {-34, "ServiceProhibited"},
    {-35, "EscrowLocked"},
    {-36, "PairingProhibitedOverThisConnection"},
    {-37, "FMiPProtected"},
    {-38, "MCProtected"},
    {-39, "MCChallengeRequired"},
    {-256, "Unknown"},
    {100, "Deallocated"},
    {101, "NotStartService"},
};

constexpr KindName kAfc[] = {
    {1, "UnknownError"},
    {2, "OpHeaderInvalid"},
    {3, "NoResources"},
    {4, "ReadError"},
    {5, "WriteError"},
    {6, "UnknownPacketType"},
    {7, "InvalidArg"},
    {8, "ObjectNotFound"},
    {9, "ObjectIsDir"},
    {10, "PermDenied"},
    {11, "ServiceNotConnected"},
    {12, "OpTimeout"},
    {13, "TooMuchData"},
    {14, "EndOfData"},
    {15, "OpNotSupported"},
    {16, "ObjectExists"},
    {17, "ObjectBusy"},
    {18, "NoSpaceLeft"},
    {19, "OpWouldBlock"},
    {20, "IoError"},
    {21, "OpInterrupted"},
    {22, "OpInProgress"},
    {23, "InternalError"},
    {30, "MuxError"},
    {31, "NoMemory"},
    {32, "NotEnoughData"},
    {33, "DirNotEmpty"},
    {100, "DeallocatedClient"},
};

constexpr KindName kInstProxy[] = {
    {-1, "InvalidArgument"},
    {-2, "PlistError"},
    {-3, "ConnectionFailed"},
    {-4, "OperationInProgress"},
    {-5, "OperationFailed"},
    {-6, "ReceiveTimeout"},
    {-7, "AlreadyArchived"},
    {-8, "APIInternalError"},
    {-9, "ApplicationAlreadyInstalled"},
    {-10, "ApplicationMoveFailed"},
    {-11, "ApplicationSINFCaptureFailed"},
    {-12, "ApplicationSandboxFailed"},
    {-13, "ApplicationVerificationFailed"},
    {-14, "ArchiveDestructionFailed"},
    {-15, "BundleVerificationFailed"},
    {-16, "CarrierBundleCopyFailed"},
    {-17, "CarrierBundleDirectoryCreationFailed"},
    {-18, "CarrierBundleMissingSupportedSIMs"},
    {-19, "CommCenterNotificationFailed"},
    {-20, "ContainerCreationFailed"},
    {-21, "ContainerP0wnFailed"},
    {-22, "ContainerRemovalFailed"},
    {-23, "EmbeddedProfileInstallFailed"},
    {-24, "ExecutableTwiddleFailed"},
    {-25, "ExistenceCheckFailed"},
    {-26, "InstallMapUpdateFailed"},
    {-27, "ManifestCaptureFailed"},
    {-28, "MapGenerationFailed"},
    {-29, "MissingBundleExecutable"},
    {-30, "MissingBundleIdentifier"},
    {-31, "MissingBundlePath"},
    {-32, "MissingContainer"},
    {-33, "NotificationFailed"},
    {-34, "PackageExtractionFailed"},
    {-35, "PackageInspectionFailed"},
    {-36, "PackageMoveFailed"},
    {-37, "PathConversionFailed"},
    {-38, "RestoreContainerFailed"},
    {-39, "SeatbeltProfileRemovalFailed"},
    {-40, "StageCreationFailed"},
    {-41, "SymlinkFailed"},
    {-42, "UnknownCommand"},
    {-43, "iTunesArtworkCaptureFailed"},
    {-44, "iTunesMetadataCaptureFailed"},
    {-45, "DeviceOSVersionTooLow"},
    {-46, "DeviceFamilyNotSupported"},
    {-47, "PackagePatchFailed"},
    {-48, "IncorrectArchitecture"},
    {-49, "PluginCopyFailed"},
    {-50, "BreadcrumbFailed"},
    {-51, "BreadcrumbUnlockFailed"},
    {-52, "GeoJSONCaptureFailed"},
    {-53, "NewsstandArtworkCaptureFailed"},
    {-54, "MissingCommand"},
    {-55, "NotEntitled"},
    {-56, "MissingPackagePath"},
    {-57, "MissingContainerPath"},
    {-58, "MissingApplicationIdentifier"},
    {-59, "MissingAttributeValue"},
    {-60, "LookupFailed"},
    {-61, "DictCreationFailed"},
    {-62, "InstallProhibited"},
    {-63, "UninstallProhibited"},
    {-64, "MissingBundleVersion"},
    {-256, "Unknown"},
    {100, "DeallocatedClient"},
};

constexpr KindName kSyslogRelay[] = {
    {-1, "InvalidArgument"},
    {-2, "MuxError"},
    {-3, "SslError"},
    {-4, "NotEnoughData"},
    {-5, "Timeout"},
    {-256, "Unknown"},
    {100, "DeallocatedClient"},
};

constexpr KindName kScreenshot[] = {
    {-1, "InvalidArgument"},
    {-2, "PlistError"},
    {-3, "MuxError"},
    {-4, "SslError"},
    {-5, "ReceiveTimeout"},
    {-6, "BadVersion"},
    {-256, "Unknown"},
    {100, "DeallocatedService"},
};

constexpr KindName kSpringboard[] = {
    {-1, "InvalidArgument"},
    {-2, "PlistError"},
    {-3, "ConnectionFailed"},
    {-256, "Unknown"},
    {100, "DeallocatedService"},
};

constexpr KindName kHouseArrest[] = {
    {-1, "InvalidArgument"},
    {-2, "PlistError"},
    {-3, "ConnectionFailed"},
    {-4, "InvalidMode"},
    {-256, "Unknown"},
    {100, "DeallocatedClient"},
};

constexpr KindName kFileRelay[] = {
    {-1, "InvalidArgument"},
    {-2, "PlistError"},
    {-3, "MuxError"},
    {-4, "InvalidSource"},
    {-5, "StagingEmpty"},
    {-6, "PermissionDenied"},
    {-256, "Unknown"},
    {100, "DeallocatedClient"},
};

constexpr KindName kDebugServer[] = {
    {-1, "InvalidArgument"},
    {-2, "MuxError"},
    {-3, "SslError"},
    {-4, "ResponseError"},
    {-5, "Timeout"},
    {-256, "Unknown"},
    {100, "DeallocatedClient"},
    {101, "DeallocatedCommand"},
};

template <size_t N> const char* find_name(const KindName (&table)[N], int32_t code) {
    for (const auto& entry : table) {
        if (entry.code == code) {
            return entry.name;
        }
    }
    return nullptr;
}

const char* lookup(ErrorDomain domain, int32_t code) {
    switch (domain) {
    case ErrorDomain::MobileDevice:
        return find_name(kMobileDevice, code);
    case ErrorDomain::Plist:
        return find_name(kPlist, code);
    case ErrorDomain::Lockdown:
        return find_name(kLockdown, code);
    case ErrorDomain::Afc:
        return find_name(kAfc, code);
    case ErrorDomain::InstProxy:
        return find_name(kInstProxy, code);
    case ErrorDomain::SyslogRelay:
        return find_name(kSyslogRelay, code);
    case ErrorDomain::Screenshot:
        return find_name(kScreenshot, code);
    case ErrorDomain::Springboard:
        return find_name(kSpringboard, code);
    case ErrorDomain::HouseArrest:
        return find_name(kHouseArrest, code);
    case ErrorDomain::FileRelay:
        return find_name(kFileRelay, code);
    case ErrorDomain::DebugServer:
        return find_name(kDebugServer, code);
    }
    return nullptr;
}

template <size_t N> std::optional<int32_t> find_code(const KindName (&table)[N], const std::string& name) {
    for (const auto& entry : table) {
        if (name == entry.name) {
            return entry.code;
        }
    }
    return std::nullopt;
}

} // namespace

Error::Error(ErrorDomain domain, int32_t code, std::string message)
    : domain(domain), code(code), message(std::move(message)) {
}

const char* Error::domain_name() const noexcept {
    switch (domain) {
    case ErrorDomain::MobileDevice:
        return "MobileDeviceError";
    case ErrorDomain::Plist:
        return "PlistError";
    case ErrorDomain::Lockdown:
        return "LockdownError";
    case ErrorDomain::Afc:
        return "AfcError";
    case ErrorDomain::InstProxy:
        return "InstallationProxyError";
    case ErrorDomain::SyslogRelay:
        return "SyslogRelayError";
    case ErrorDomain::Screenshot:
        return "ScreenshotError";
    case ErrorDomain::Springboard:
        return "SpringboardError";
    case ErrorDomain::HouseArrest:
        return "HouseArrestError";
    case ErrorDomain::FileRelay:
        return "FileRelayError";
    case ErrorDomain::DebugServer:
        return "DebugServerError";
    }
    return "Error";
}

std::string Error::kind_name() const {
    const char* name = lookup(domain, code);
    if (name) {
        return name;
    }
    return "Unknown(" + std::to_string(code) + ")";
}

std::string Error::to_string() const {
    std::string out = std::string(domain_name()) + "." + kind_name();
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

Error Error::Disconnected() {
    return Error(MobileDeviceError::Disconnected, "connection is closed");
}

Error Error::InvalidArgument(std::string message) {
    return Error(MobileDeviceError::InvalidArgument, std::move(message));
}

std::optional<int32_t> Error::code_for_name(ErrorDomain domain, const std::string& name) {
    switch (domain) {
    case ErrorDomain::MobileDevice:
        return find_code(kMobileDevice, name);
    case ErrorDomain::Plist:
        return find_code(kPlist, name);
    case ErrorDomain::Lockdown:
        return find_code(kLockdown, name);
    case ErrorDomain::Afc:
        return find_code(kAfc, name);
    case ErrorDomain::InstProxy:
        return find_code(kInstProxy, name);
    case ErrorDomain::SyslogRelay:
        return find_code(kSyslogRelay, name);
    case ErrorDomain::Screenshot:
        return find_code(kScreenshot, name);
    case ErrorDomain::Springboard:
        return find_code(kSpringboard, name);
    case ErrorDomain::HouseArrest:
        return find_code(kHouseArrest, name);
    case ErrorDomain::FileRelay:
        return find_code(kFileRelay, name);
    case ErrorDomain::DebugServer:
        return find_code(kDebugServer, name);
    }
    return std::nullopt;
}

} // namespace Busq
