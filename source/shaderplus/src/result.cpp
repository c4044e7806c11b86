#include "shaderplus/result.hpp"

namespace shaderplus
{
    const char* error_code_name(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::eOk:
                return "Ok";
            case ErrorCode::eIO:
                return "IO";
            case ErrorCode::eInvalidArgument:
                return "InvalidArgument";
            case ErrorCode::eParseError:
                return "ParseError";
            case ErrorCode::eUnknownOperation:
                return "UnknownOperation";
            case ErrorCode::eInvalidIfBlock:
                return "InvalidIfBlock";
            case ErrorCode::eLeftoverLines:
                return "LeftoverLines";
            case ErrorCode::eNoExpression:
                return "NoExpression";
            case ErrorCode::eNoClosingParenthesis:
                return "NoClosingParenthesis";
            case ErrorCode::eDuplicatePeriod:
                return "DuplicatePeriod";
            case ErrorCode::eInvalidBase:
                return "InvalidBase";
            case ErrorCode::eParseInt:
                return "ParseInt";
            case ErrorCode::eParseFloat:
                return "ParseFloat";
            case ErrorCode::eLeftoverChars:
                return "LeftoverChars";
            case ErrorCode::eUndefinedVariable:
                return "UndefinedVariable";
            case ErrorCode::eInvalidExpression:
                return "InvalidExpression";
            case ErrorCode::eNotFound:
                return "NotFound";
            case ErrorCode::eIncludeCycle:
                return "IncludeCycle";
            default:
                return "Unknown";
        }
    }
} // namespace shaderplus
