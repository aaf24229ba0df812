#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Failure reported by SQLite, with the primary result code.
 */
class SQLiteError : public std::runtime_error
{
  public:
    SQLiteError(int resultCode, const std::string& message) : std::runtime_error(message), _resultCode(resultCode)
    {
    }

    int ResultCode() const noexcept
    {
        return _resultCode;
    }

  private:
    int _resultCode;
};
