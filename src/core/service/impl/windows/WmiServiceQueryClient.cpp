#include "WmiServiceQueryClient.h"
#include "WideString.h"
#include "core/service/util/ServiceException.h"

#include <windows.h>
#include <comdef.h>
#include <Wbemidl.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>

namespace svcmon::core::service::windows {

namespace {

template <typename T>
struct ComRelease {
    void operator()(T* ptr) const {
        if (ptr != nullptr) {
            ptr->Release();
        }
    }
};

template <typename T>
using ComPtr = std::unique_ptr<T, ComRelease<T>>;

std::string hresultText(const char* call, HRESULT hr) {
    std::ostringstream oss;
    oss << call << " failed. HRESULT: 0x" << std::hex << static_cast<unsigned long>(hr);
    return oss.str();
}

/**
 * @brief 현재 스레드의 COM 초기화 (스코프 종료 시 해제)
 *
 * 이미 다른 아파트먼트 모드로 초기화된 스레드는 그대로 사용함.
 */
class ComScope {
public:
    ComScope() {
        const HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
        if (SUCCEEDED(hr)) {
            initialized_ = true;
        } else if (hr != RPC_E_CHANGED_MODE) {
            throw ConnectionException(hresultText("CoInitializeEx", hr));
        }
    }

    ~ComScope() {
        if (initialized_) {
            CoUninitialize();
        }
    }

    ComScope(const ComScope&) = delete;
    ComScope& operator=(const ComScope&) = delete;

private:
    bool initialized_ = false;
};

std::optional<std::string> readOptionalString(IWbemClassObject* obj, const wchar_t* property) {
    _variant_t vt;
    if (FAILED(obj->Get(property, 0, &vt, nullptr, nullptr))) {
        return std::nullopt;
    }
    if (vt.vt != VT_BSTR || vt.bstrVal == nullptr) {
        return std::nullopt;
    }
    return toUtf8(vt.bstrVal);
}

std::string readString(IWbemClassObject* obj, const wchar_t* property) {
    return readOptionalString(obj, property).value_or("");
}

uint32_t readUInt32(IWbemClassObject* obj, const wchar_t* property) {
    _variant_t vt;
    if (FAILED(obj->Get(property, 0, &vt, nullptr, nullptr))) {
        return 0;
    }
    switch (vt.vt) {
        case VT_I4:  return static_cast<uint32_t>(vt.lVal);
        case VT_UI4: return vt.ulVal;
        default:     return 0;
    }
}

} // namespace

WmiServiceQueryClient::WmiServiceQueryClient(std::string wmiNamespace)
    : wmiNamespace_(std::move(wmiNamespace)) {
}

std::vector<RawQueryService> WmiServiceQueryClient::queryServices(const std::string& wql) {
    ComScope com;

    IWbemLocator* rawLocator = nullptr;
    HRESULT hr = CoCreateInstance(CLSID_WbemLocator, nullptr, CLSCTX_INPROC_SERVER,
                                  IID_IWbemLocator, reinterpret_cast<LPVOID*>(&rawLocator));
    if (FAILED(hr)) {
        throw ConnectionException(hresultText("CoCreateInstance(WbemLocator)", hr));
    }
    ComPtr<IWbemLocator> locator(rawLocator);

    IWbemServices* rawServices = nullptr;
    hr = locator->ConnectServer(_bstr_t(toWide(wmiNamespace_).c_str()), nullptr, nullptr, nullptr,
                                0, nullptr, nullptr, &rawServices);
    if (FAILED(hr)) {
        throw ConnectionException(hresultText("IWbemLocator::ConnectServer", hr));
    }
    ComPtr<IWbemServices> services(rawServices);

    hr = CoSetProxyBlanket(services.get(), RPC_C_AUTHN_WINNT, RPC_C_AUTHZ_NONE, nullptr,
                           RPC_C_AUTHN_LEVEL_CALL, RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE);
    if (FAILED(hr)) {
        throw ConnectionException(hresultText("CoSetProxyBlanket", hr));
    }

    IEnumWbemClassObject* rawEnumerator = nullptr;
    hr = services->ExecQuery(_bstr_t(L"WQL"), _bstr_t(toWide(wql).c_str()),
                             WBEM_FLAG_FORWARD_ONLY | WBEM_FLAG_RETURN_IMMEDIATELY,
                             nullptr, &rawEnumerator);
    if (FAILED(hr)) {
        throw EnumerationException(hresultText("IWbemServices::ExecQuery", hr));
    }
    ComPtr<IEnumWbemClassObject> enumerator(rawEnumerator);

    std::vector<RawQueryService> result;
    for (;;) {
        IWbemClassObject* rawObject = nullptr;
        ULONG returned = 0;
        hr = enumerator->Next(WBEM_INFINITE, 1, &rawObject, &returned);
        if (FAILED(hr)) {
            throw EnumerationException(hresultText("IEnumWbemClassObject::Next", hr));
        }
        if (returned == 0) {
            break;
        }
        ComPtr<IWbemClassObject> object(rawObject);

        RawQueryService entry;
        entry.name = readString(object.get(), L"Name");
        entry.displayName = readString(object.get(), L"DisplayName");
        entry.processId = readUInt32(object.get(), L"ProcessId");
        entry.state = readString(object.get(), L"State");
        entry.status = readString(object.get(), L"Status");
        entry.startMode = readString(object.get(), L"StartMode");
        entry.startName = readOptionalString(object.get(), L"StartName");
        result.push_back(std::move(entry));
    }

    spdlog::trace("WMI query returned {} objects", result.size());
    return result;
}

} // namespace svcmon::core::service::windows
