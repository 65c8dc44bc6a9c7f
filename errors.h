#ifndef _ERRORS_H_
#define _ERRORS_H_

#include <string>

enum ErrorCode
{
    EC_OK = 0,
    EC_PARSE_ERROR,
    EC_STRUCTURE_ERROR,
    EC_TIMEOUT,
    EC_EXHAUSTED_FALLBACK,
    EC_CONFIG_ERROR,
};

const char* error_code_name(ErrorCode code);

class Error
{
public:
    Error() :
        m_code(EC_OK), m_message()
    {
    }

    Error(ErrorCode code, const std::string& message) :
        m_code(code), m_message(message)
    {
    }

    ErrorCode code() const
    {
        return this->m_code;
    }

    const std::string& message() const
    {
        return this->m_message;
    }

    bool ok() const
    {
        return this->m_code == EC_OK;
    }

    void clear()
    {
        this->m_code = EC_OK;
        this->m_message.clear();
    }

    // keeps the code, prefixes the message
    Error wrap(const std::string& context) const;

    std::string to_string() const;

private:
    ErrorCode m_code;
    std::string m_message;
};

// fills *error when error is not NULL, always returns false
bool set_error(Error* error, ErrorCode code, const std::string& message);

#endif
