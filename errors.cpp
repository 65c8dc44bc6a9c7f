#include "errors.h"

using namespace std;

const char* error_code_name(ErrorCode code)
{
    switch (code)
    {
    case EC_OK:
        return "ok";
    case EC_PARSE_ERROR:
        return "parse error";
    case EC_STRUCTURE_ERROR:
        return "structure error";
    case EC_TIMEOUT:
        return "timeout";
    case EC_EXHAUSTED_FALLBACK:
        return "exhausted fallback";
    case EC_CONFIG_ERROR:
        return "config error";
    default:
        return "unknown error";
    }
}

Error Error::wrap(const string& context) const
{
    if (this->m_message.empty())
    {
        return Error(this->m_code, context);
    }

    return Error(this->m_code, context + ": " + this->m_message);
}

string Error::to_string() const
{
    string result(error_code_name(this->m_code));
    if (!this->m_message.empty())
    {
        result.append(": ");
        result.append(this->m_message);
    }

    return result;
}

bool set_error(Error* error, ErrorCode code, const string& message)
{
    if (error != NULL)
    {
        *error = Error(code, message);
    }

    return false;
}
