// busq++ contributors

#ifndef BUSQ_ERROR_HPP
#define BUSQ_ERROR_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace Busq {

enum class ErrorDomain : uint8_t {
    MobileDevice,
    Plist,
    Lockdown,
    Afc,
    InstProxy,
    SyslogRelay,
    Screenshot,
    Springboard,
    HouseArrest,
    FileRelay,
    DebugServer,
};

enum class MobileDeviceError : int32_t {
    InvalidArgument   = -1,
    Unknown           = -2,
    NoDevice          = -3,
    NotEnoughData     = -4,
    SslError          = -5,
    Timeout           = -6,
    DeallocatedDevice = 100,
    Disconnected      = 101,
};

// Same values as libplist's plist_err_t
enum class PlistError : int32_t {
    InvalidArgument = -1,
    FormatError     = -2,
    ParseError      = -3,
    NoMemory        = -4,
    IoError         = -5,
    Unknown         = -255,
};

enum class LockdownError : int32_t {
    InvalidArgument                     = -1,
    InvalidConfiguration                = -2,
    PlistError                          = -3,
    PairingFailed                       = -4,
    SslError                            = -5,
    DictError                           = -6,
    ReceiveTimeout                      = -7,
    MuxError                            = -8,
    NoRunningSession                    = -9,
    InvalidResponse                     = -10,
    MissingKey                          = -11,
    MissingValue                        = -12,
    GetProhibited                       = -13,
    SetProhibited                       = -14,
    RemoveProhibited                    = -15,
    ImmutableValue                      = -16,
    PasswordProtected                   = -17,
    UserDeniedPairing                   = -18,
    PairingDialogResponsePending        = -19,
    MissingHostID                       = -20,
    InvalidHostID                       = -21,
    SessionActive                       = -22,
    SessionInactive                     = -23,
    MissingSessionID                    = -24,
    InvalidSessionID                    = -25,
    MissingService                      = -26,
    InvalidService                      = -27,
    ServiceLimit                        = -28,
    MissingPairRecord                   = -29,
    SavePairRecordFailed                = -30,
    InvalidPairRecord                   = -31,
    InvalidActivationRecord             = -32,
    MissingActivationRecord             = -33,
    ServiceProhibited                   = -34,
    EscrowLocked                        = -35,
    PairingProhibitedOverThisConnection = -36,
    FmipProtected                       = -37,
    McProtected                         = -38,
    McChallengeRequired                 = -39,
    Unknown                             = -256,
    Deallocated                         = 100,
    NotStartService                     = 101,
};

enum class AfcError : int32_t {
    UnknownError          = 1,
    OpHeaderInvalid       = 2,
    NoResources           = 3,
    ReadError             = 4,
    WriteError            = 5,
    UnknownPacketType     = 6,
    InvalidArg            = 7,
    ObjectNotFound        = 8,
    ObjectIsDir           = 9,
    PermDenied            = 10,
    ServiceNotConnected   = 11,
    OpTimeout             = 12,
    TooMuchData           = 13,
    EndOfData             = 14,
    OpNotSupported        = 15,
    ObjectExists          = 16,
    ObjectBusy            = 17,
    NoSpaceLeft           = 18,
    OpWouldBlock          = 19,
    IoError               = 20,
    OpInterrupted         = 21,
    OpInProgress          = 22,
    InternalError         = 23,
    MuxError              = 30,
    NoMemory              = 31,
    NotEnoughData         = 32,
    DirNotEmpty           = 33,
    DeallocatedClient     = 100,
};

enum class InstProxyError : int32_t {
    InvalidArgument                      = -1,
    PlistError                           = -2,
    ConnectionFailed                     = -3,
    OperationInProgress                  = -4,
    OperationFailed                      = -5,
    ReceiveTimeout                       = -6,
    AlreadyArchived                      = -7,
    ApiInternalError                     = -8,
    ApplicationAlreadyInstalled          = -9,
    ApplicationMoveFailed                = -10,
    ApplicationSinfCaptureFailed         = -11,
    ApplicationSandboxFailed             = -12,
    ApplicationVerificationFailed        = -13,
    ArchiveDestructionFailed             = -14,
    BundleVerificationFailed             = -15,
    CarrierBundleCopyFailed              = -16,
    CarrierBundleDirectoryCreationFailed = -17,
    CarrierBundleMissingSupportedSims    = -18,
    CommCenterNotificationFailed         = -19,
    ContainerCreationFailed              = -20,
    ContainerP0wnFailed                  = -21,
    ContainerRemovalFailed               = -22,
    EmbeddedProfileInstallFailed         = -23,
    ExecutableTwiddleFailed              = -24,
    ExistenceCheckFailed                 = -25,
    InstallMapUpdateFailed               = -26,
    ManifestCaptureFailed                = -27,
    MapGenerationFailed                  = -28,
    MissingBundleExecutable              = -29,
    MissingBundleIdentifier              = -30,
    MissingBundlePath                    = -31,
    MissingContainer                     = -32,
    NotificationFailed                   = -33,
    PackageExtractionFailed              = -34,
    PackageInspectionFailed              = -35,
    PackageMoveFailed                    = -36,
    PathConversionFailed                 = -37,
    RestoreContainerFailed               = -38,
    SeatbeltProfileRemovalFailed         = -39,
    StageCreationFailed                  = -40,
    SymlinkFailed                        = -41,
    UnknownCommand                       = -42,
    ItunesArtworkCaptureFailed           = -43,
    ItunesMetadataCaptureFailed          = -44,
    DeviceOsVersionTooLow                = -45,
    DeviceFamilyNotSupported             = -46,
    PackagePatchFailed                   = -47,
    IncorrectArchitecture                = -48,
    PluginCopyFailed                     = -49,
    BreadcrumbFailed                     = -50,
    BreadcrumbUnlockFailed               = -51,
    GeojsonCaptureFailed                 = -52,
    NewsstandArtworkCaptureFailed        = -53,
    MissingCommand                       = -54,
    NotEntitled                          = -55,
    MissingPackagePath                   = -56,
    MissingContainerPath                 = -57,
    MissingApplicationIdentifier         = -58,
    MissingAttributeValue                = -59,
    LookupFailed                         = -60,
    DictCreationFailed                   = -61,
    InstallProhibited                    = -62,
    UninstallProhibited                  = -63,
    MissingBundleVersion                 = -64,
    Unknown                              = -256,
    DeallocatedClient                    = 100,
};

enum class SyslogRelayError : int32_t {
    InvalidArgument   = -1,
    MuxError          = -2,
    SslError          = -3,
    NotEnoughData     = -4,
    Timeout           = -5,
    Unknown           = -256,
    DeallocatedClient = 100,
};

enum class ScreenshotError : int32_t {
    InvalidArgument    = -1,
    PlistError         = -2,
    MuxError           = -3,
    SslError           = -4,
    ReceiveTimeout     = -5,
    BadVersion         = -6,
    Unknown            = -256,
    DeallocatedService = 100,
};

enum class SpringboardError : int32_t {
    InvalidArgument    = -1,
    PlistError         = -2,
    ConnectionFailed   = -3,
    Unknown            = -256,
    DeallocatedService = 100,
};

enum class HouseArrestError : int32_t {
    InvalidArgument   = -1,
    PlistError        = -2,
    ConnectionFailed  = -3,
    InvalidMode       = -4,
    Unknown           = -256,
    DeallocatedClient = 100,
};

enum class FileRelayError : int32_t {
    InvalidArgument   = -1,
    PlistError        = -2,
    MuxError          = -3,
    InvalidSource     = -4,
    StagingEmpty      = -5,
    PermissionDenied  = -6,
    Unknown           = -256,
    DeallocatedClient = 100,
};

enum class DebugServerError : int32_t {
    InvalidArgument    = -1,
    MuxError           = -2,
    SslError           = -3,
    ResponseError      = -4,
    Timeout            = -5,
    Unknown            = -256,
    DeallocatedClient  = 100,
    DeallocatedCommand = 101,
};

// Maps each taxonomy enum onto its domain
template <typename E> struct ErrorTraits;

#define BUSQ_ERROR_DOMAIN(Enum, Domain)                                                            \
    template <> struct ErrorTraits<Enum> {                                                         \
        static constexpr ErrorDomain domain = ErrorDomain::Domain;                                 \
    }

BUSQ_ERROR_DOMAIN(MobileDeviceError, MobileDevice);
BUSQ_ERROR_DOMAIN(PlistError, Plist);
BUSQ_ERROR_DOMAIN(LockdownError, Lockdown);
BUSQ_ERROR_DOMAIN(AfcError, Afc);
BUSQ_ERROR_DOMAIN(InstProxyError, InstProxy);
BUSQ_ERROR_DOMAIN(SyslogRelayError, SyslogRelay);
BUSQ_ERROR_DOMAIN(ScreenshotError, Screenshot);
BUSQ_ERROR_DOMAIN(SpringboardError, Springboard);
BUSQ_ERROR_DOMAIN(HouseArrestError, HouseArrest);
BUSQ_ERROR_DOMAIN(FileRelayError, FileRelay);
BUSQ_ERROR_DOMAIN(DebugServerError, DebugServer);

#undef BUSQ_ERROR_DOMAIN

class Error {
  public:
    ErrorDomain domain = ErrorDomain::MobileDevice;
    int32_t     code   = 0;
    std::string message;

    Error() = default;
    Error(ErrorDomain domain, int32_t code, std::string message);

    template <typename E, typename = decltype(ErrorTraits<E>::domain)>
    explicit Error(E kind, std::string message = {})
        : domain(ErrorTraits<E>::domain), code(static_cast<int32_t>(kind)),
          message(std::move(message)) {}

    template <typename E, typename = decltype(ErrorTraits<E>::domain)> bool is(E kind) const {
        return domain == ErrorTraits<E>::domain && code == static_cast<int32_t>(kind);
    }

    bool        in(ErrorDomain d) const noexcept { return domain == d; }

    // "AfcError", "LockdownError", ...
    const char* domain_name() const noexcept;
    // Symbolic kind; codes outside the taxonomy render as "Unknown(<code>)"
    std::string kind_name() const;
    // "AfcError.ObjectNotFound: <message>"
    std::string to_string() const;

    static Error Disconnected();
    static Error InvalidArgument(std::string message = {});

    // Reverse of kind_name() within one domain
    static std::optional<int32_t> code_for_name(ErrorDomain domain, const std::string& name);
};

} // namespace Busq
#endif
