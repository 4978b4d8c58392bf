#include "error_kind.hpp"

ErrorKind errorKindFromCode(int code)
{
    switch (code)
    {
    case 0:
        return ErrorKind::Success;
    case 1:
        return ErrorKind::Fatal;
    case 2:
        return ErrorKind::NoModule;
    case 3:
        return ErrorKind::Network;
    case 4:
        return ErrorKind::LoginFailed;
    case 5:
        return ErrorKind::MaxWaitReached;
    case 6:
        return ErrorKind::MaxTriesReached;
    case 7:
        return ErrorKind::CaptchaFailed;
    case 8:
        return ErrorKind::SystemFailure;
    case 10:
        return ErrorKind::TemporarilyUnavailable;
    case 11:
        return ErrorKind::PasswordRequired;
    case 12:
        return ErrorKind::NeedPermissions;
    case 13:
        return ErrorKind::LinkDead;
    case 130:
        return ErrorKind::Interrupted;
    default:
        return ErrorKind::Unclassified;
    }
}

int exitCodeOf(ErrorKind kind)
{
    if (kind == ErrorKind::Unclassified)
    {
        return static_cast<int>(ErrorKind::Fatal);
    }
    return static_cast<int>(kind);
}

std::string_view errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Success:
        return "SUCCESS";
    case ErrorKind::Fatal:
        return "FATAL";
    case ErrorKind::NoModule:
        return "NOMODULE";
    case ErrorKind::Network:
        return "NETWORK";
    case ErrorKind::LoginFailed:
        return "LOGIN_FAILED";
    case ErrorKind::MaxWaitReached:
        return "MAX_WAIT_REACHED";
    case ErrorKind::MaxTriesReached:
        return "MAX_TRIES_REACHED";
    case ErrorKind::CaptchaFailed:
        return "CAPTCHA";
    case ErrorKind::SystemFailure:
        return "SYSTEM";
    case ErrorKind::TemporarilyUnavailable:
        return "LINK_TEMP_UNAVAILABLE";
    case ErrorKind::PasswordRequired:
        return "LINK_PASSWORD_REQUIRED";
    case ErrorKind::NeedPermissions:
        return "LINK_NEED_PERMISSIONS";
    case ErrorKind::LinkDead:
        return "LINK_DEAD";
    case ErrorKind::Interrupted:
        return "INTERRUPTED";
    case ErrorKind::Unclassified:
    default:
        return "UNCLASSIFIED";
    }
}
