#pragma once

#include <windows.h>

#include <string>

namespace svcmon::core::service::windows {

/**
 * @brief UTF-16 -> UTF-8 변환
 */
inline std::string toUtf8(const wchar_t* value) {
    if (value == nullptr || *value == L'\0') {
        return "";
    }

    const int size = WideCharToMultiByte(CP_UTF8, 0, value, -1, nullptr, 0, nullptr, nullptr);
    if (size <= 1) {
        return "";
    }

    std::string result(static_cast<size_t>(size - 1), '\0');
    WideCharToMultiByte(CP_UTF8, 0, value, -1, result.data(), size, nullptr, nullptr);
    return result;
}

/**
 * @brief UTF-8 -> UTF-16 변환
 */
inline std::wstring toWide(const std::string& value) {
    if (value.empty()) {
        return L"";
    }

    const int size = MultiByteToWideChar(CP_UTF8, 0, value.c_str(), -1, nullptr, 0);
    if (size <= 1) {
        return L"";
    }

    std::wstring result(static_cast<size_t>(size - 1), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, value.c_str(), -1, result.data(), size);
    return result;
}

} // namespace svcmon::core::service::windows
