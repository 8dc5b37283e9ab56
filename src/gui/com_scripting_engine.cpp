#include <erpl_gui/gui/com_scripting_engine.hpp>

#include <erpl_gui/core/log.hpp>

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <comdef.h>
#include <wrl/client.h>

#include <cstdio>
#include <cwchar>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace erpl_gui {

namespace {

// ---------------------------------------------------------------------------
// COM plumbing
// ---------------------------------------------------------------------------

// Keeps CoInitializeEx balanced for as long as any wrapper is alive.
class ComApartment {
public:
    ComApartment() {
        const HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
        initialized_ = SUCCEEDED(hr);
    }
    ~ComApartment() {
        if (initialized_) {
            CoUninitialize();
        }
    }
    ComApartment(const ComApartment&) = delete;
    ComApartment& operator=(const ComApartment&) = delete;

private:
    bool initialized_ = false;
};

using ApartmentPtr = std::shared_ptr<ComApartment>;

std::string ToUtf8(const wchar_t* text, int length) {
    if (text == nullptr || length <= 0) {
        return "";
    }
    const int size = WideCharToMultiByte(CP_UTF8, 0, text, length,
                                         nullptr, 0, nullptr, nullptr);
    if (size <= 0) {
        return "";
    }
    std::string result(static_cast<size_t>(size), '\0');
    WideCharToMultiByte(CP_UTF8, 0, text, length, result.data(), size,
                        nullptr, nullptr);
    return result;
}

std::string BstrToUtf8(BSTR text) {
    return text ? ToUtf8(text, static_cast<int>(SysStringLen(text))) : "";
}

std::wstring Widen(std::string_view utf8) {
    if (utf8.empty()) {
        return std::wstring();
    }
    const int size = MultiByteToWideChar(CP_UTF8, 0, utf8.data(),
                                         static_cast<int>(utf8.size()), nullptr, 0);
    std::wstring wide(static_cast<size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()),
                        wide.data(), size);
    return wide;
}

std::string HresultText(HRESULT hr) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%08lX", static_cast<unsigned long>(hr));
    return buffer;
}

using Microsoft::WRL::ComPtr;
using Dispatch = ComPtr<IDispatch>;

_variant_t TextArg(std::string_view text) {
    return _variant_t(_bstr_t(Widen(text).c_str()));
}

Error MakeComError(const std::string& operation, const std::string& target,
                   const std::string& message) {
    Error error;
    error.operation = operation;
    error.target = target;
    error.message = message;
    error.category = ErrorCategory::Unavailable;
    return error;
}

// IDispatch::Invoke by member name. `args` are in call order; COM wants them
// reversed, which is done here.
Result<void, Error> InvokeMember(const Dispatch& target,
                                 const wchar_t* member,
                                 WORD flags,
                                 const std::vector<_variant_t>& args,
                                 _variant_t* result,
                                 const std::string& context) {
    const std::string member_name = ToUtf8(member, static_cast<int>(wcslen(member)));
    if (!target) {
        return Result<void, Error>::Err(
            MakeComError(member_name, context, "object reference is empty"));
    }

    DISPID dispid = DISPID_UNKNOWN;
    LPOLESTR name = const_cast<LPOLESTR>(member);
    HRESULT hr = target->GetIDsOfNames(IID_NULL, &name, 1,
                                       LOCALE_USER_DEFAULT, &dispid);
    if (FAILED(hr)) {
        return Result<void, Error>::Err(MakeComError(
            member_name, context, "member not found (" + HresultText(hr) + ")"));
    }

    // Shallow copies; `args` keeps ownership.
    std::vector<VARIANT> reversed(args.rbegin(), args.rend());
    DISPPARAMS params{};
    params.rgvarg = reversed.empty() ? nullptr : reversed.data();
    params.cArgs = static_cast<UINT>(reversed.size());
    DISPID put_id = DISPID_PROPERTYPUT;
    if (flags & DISPATCH_PROPERTYPUT) {
        params.rgdispidNamedArgs = &put_id;
        params.cNamedArgs = 1;
    }

    EXCEPINFO excep{};
    UINT arg_error = 0;
    hr = target->Invoke(dispid, IID_NULL, LOCALE_USER_DEFAULT, flags,
                        &params, result, &excep, &arg_error);

    // Take ownership so the strings are freed on every path.
    const _bstr_t source(excep.bstrSource, false);
    const _bstr_t description(excep.bstrDescription, false);
    const _bstr_t help_file(excep.bstrHelpFile, false);

    if (FAILED(hr)) {
        std::string message = HresultText(hr);
        if (hr == DISP_E_EXCEPTION && description.length() > 0) {
            message = BstrToUtf8(description.GetBSTR());
        }
        return Result<void, Error>::Err(MakeComError(member_name, context, message));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> GetVariant(const Dispatch& target, const wchar_t* name,
                               _variant_t* out, const std::string& context) {
    return InvokeMember(target, name, DISPATCH_PROPERTYGET | DISPATCH_METHOD,
                        {}, out, context);
}

Result<std::string, Error> GetString(const Dispatch& target, const wchar_t* name,
                                     const std::string& context) {
    _variant_t value;
    auto got = GetVariant(target, name, &value, context);
    if (got.IsErr()) {
        return Result<std::string, Error>::Err(std::move(got).Error());
    }
    if (value.vt == VT_EMPTY || value.vt == VT_NULL) {
        return Result<std::string, Error>::Ok("");
    }
    if (value.vt != VT_BSTR &&
        FAILED(VariantChangeType(&value, &value, 0, VT_BSTR))) {
        return Result<std::string, Error>::Err(MakeComError(
            ToUtf8(name, static_cast<int>(wcslen(name))), context,
            "property is not convertible to text"));
    }
    return Result<std::string, Error>::Ok(BstrToUtf8(value.bstrVal));
}

Result<long, Error> GetLong(const Dispatch& target, const wchar_t* name,
                            const std::string& context) {
    _variant_t value;
    auto got = GetVariant(target, name, &value, context);
    if (got.IsErr()) {
        return Result<long, Error>::Err(std::move(got).Error());
    }
    if (FAILED(VariantChangeType(&value, &value, 0, VT_I4))) {
        return Result<long, Error>::Err(MakeComError(
            ToUtf8(name, static_cast<int>(wcslen(name))), context,
            "property is not numeric"));
    }
    return Result<long, Error>::Ok(value.lVal);
}

Result<Dispatch, Error> TakeDispatch(const _variant_t& value, const std::string& member,
                                     const std::string& context) {
    if (value.vt != VT_DISPATCH || value.pdispVal == nullptr) {
        return Result<Dispatch, Error>::Err(
            MakeComError(member, context, "did not return an object"));
    }
    return Result<Dispatch, Error>::Ok(Dispatch(value.pdispVal));
}

Result<Dispatch, Error> GetObjectProperty(const Dispatch& target, const wchar_t* name,
                                          const std::string& context) {
    _variant_t value;
    auto got = GetVariant(target, name, &value, context);
    if (got.IsErr()) {
        return Result<Dispatch, Error>::Err(std::move(got).Error());
    }
    return TakeDispatch(value, ToUtf8(name, static_cast<int>(wcslen(name))),
                        context);
}

// GuiComponentCollection helpers (Children.Count / Children.ElementAt(i)).
Result<size_t, Error> ChildCount(const Dispatch& parent, const std::string& context) {
    auto children = GetObjectProperty(parent, L"Children", context);
    if (children.IsErr()) {
        return Result<size_t, Error>::Err(std::move(children).Error());
    }
    auto count = GetLong(children.Value(), L"Count", context);
    if (count.IsErr()) {
        return Result<size_t, Error>::Err(std::move(count).Error());
    }
    return Result<size_t, Error>::Ok(static_cast<size_t>(count.Value()));
}

Result<Dispatch, Error> ChildAt(const Dispatch& parent, size_t index,
                                const std::string& context) {
    auto children = GetObjectProperty(parent, L"Children", context);
    if (children.IsErr()) {
        return Result<Dispatch, Error>::Err(std::move(children).Error());
    }
    _variant_t value;
    auto called = InvokeMember(children.Value(), L"ElementAt", DISPATCH_METHOD,
                               {_variant_t(static_cast<long>(index))}, &value,
                               context);
    if (called.IsErr()) {
        return Result<Dispatch, Error>::Err(std::move(called).Error());
    }
    return TakeDispatch(value, "ElementAt", context);
}

// ---------------------------------------------------------------------------
// Wrappers
// ---------------------------------------------------------------------------

class ComGuiElement : public IGuiElement {
public:
    ComGuiElement(ApartmentPtr apartment, Dispatch component, std::string id)
        : apartment_(std::move(apartment)), component_(std::move(component)),
          id_(std::move(id)) {}

    std::string Id() const override { return id_; }

    Result<std::string, Error> Text() override {
        return GetString(component_, L"Text", id_);
    }

    Result<void, Error> SetText(std::string_view text) override {
        return InvokeMember(component_, L"Text", DISPATCH_PROPERTYPUT,
                            {TextArg(text)}, nullptr, id_);
    }

    Result<bool, Error> IsChangeable() override {
        _variant_t value;
        auto got = GetVariant(component_, L"Changeable", &value, id_);
        if (got.IsErr()) {
            return Result<bool, Error>::Err(std::move(got).Error());
        }
        if (FAILED(VariantChangeType(&value, &value, 0, VT_BOOL))) {
            return Result<bool, Error>::Err(
                MakeComError("Changeable", id_, "property is not boolean"));
        }
        return Result<bool, Error>::Ok(value.boolVal != VARIANT_FALSE);
    }

    Result<void, Error> Invoke() override {
        auto type = GetString(component_, L"Type", id_);
        const std::string type_name = type.IsOk() ? type.Value() : "";
        const wchar_t* method = L"press";
        if (type_name == "GuiRadioButton" || type_name == "GuiMenu" ||
            type_name == "GuiTab") {
            method = L"select";
        }
        return InvokeMember(component_, method, DISPATCH_METHOD, {}, nullptr, id_);
    }

    Result<void, Error> SendVKey(int code) override {
        return InvokeMember(component_, L"sendVKey", DISPATCH_METHOD,
                            {_variant_t(static_cast<long>(code))}, nullptr, id_);
    }

    Result<std::string, Error> Property(std::string_view name) override {
        const auto wide = Widen(name);
        return GetString(component_, wide.c_str(), id_);
    }

private:
    ApartmentPtr apartment_;
    Dispatch component_;
    std::string id_;
};

class ComGuiSession : public IGuiSession {
public:
    ComGuiSession(ApartmentPtr apartment, Dispatch session)
        : apartment_(std::move(apartment)), session_(std::move(session)) {}

    Result<GuiElementPtr, Error> FindById(std::string_view id) override {
        const std::string target(id);
        // raise = false: return Nothing instead of failing
        _variant_t value;
        auto called = InvokeMember(session_, L"findById", DISPATCH_METHOD,
                                   {TextArg(id), _variant_t(false)}, &value, target);
        if (called.IsErr()) {
            return Result<GuiElementPtr, Error>::Err(std::move(called).Error());
        }
        auto component = TakeDispatch(value, "findById", target);
        if (component.IsErr()) {
            return Result<GuiElementPtr, Error>::Err(std::move(component).Error());
        }
        return Result<GuiElementPtr, Error>::Ok(std::make_shared<ComGuiElement>(
            apartment_, std::move(component).Value(), target));
    }

    Result<SessionInfo, Error> Info() override {
        auto info = GetObjectProperty(session_, L"Info", "GuiSession");
        if (info.IsErr()) {
            return Result<SessionInfo, Error>::Err(std::move(info).Error());
        }
        const auto& obj = info.Value();
        const std::string context = "GuiSessionInfo";

        SessionInfo result;
        auto transaction = GetString(obj, L"Transaction", context);
        if (transaction.IsErr()) {
            return Result<SessionInfo, Error>::Err(std::move(transaction).Error());
        }
        result.transaction = transaction.Value();
        result.system_name = GetString(obj, L"SystemName", context).ValueOr("");
        result.client = GetString(obj, L"Client", context).ValueOr("");
        result.user = GetString(obj, L"User", context).ValueOr("");
        result.language = GetString(obj, L"Language", context).ValueOr("");
        result.program = GetString(obj, L"Program", context).ValueOr("");
        result.screen_number =
            static_cast<int>(GetLong(obj, L"ScreenNumber", context).ValueOr(0));
        result.response_time_ms =
            static_cast<int>(GetLong(obj, L"ResponseTime", context).ValueOr(0));
        return Result<SessionInfo, Error>::Ok(std::move(result));
    }

private:
    ApartmentPtr apartment_;
    Dispatch session_;
};

class ComGuiConnection : public IGuiConnection {
public:
    ComGuiConnection(ApartmentPtr apartment, Dispatch connection)
        : apartment_(std::move(apartment)), connection_(std::move(connection)) {
        description_ = GetString(connection_, L"Description", "GuiConnection").ValueOr("");
    }

    std::string Description() const override { return description_; }

    Result<size_t, Error> SessionCount() override {
        return ChildCount(connection_, description_);
    }

    Result<GuiSessionPtr, Error> Session(size_t index) override {
        auto session = ChildAt(connection_, index, description_);
        if (session.IsErr()) {
            return Result<GuiSessionPtr, Error>::Err(std::move(session).Error());
        }
        return Result<GuiSessionPtr, Error>::Ok(
            std::make_shared<ComGuiSession>(apartment_, std::move(session).Value()));
    }

private:
    ApartmentPtr apartment_;
    Dispatch connection_;
    std::string description_;
};

class ComScriptingEngine : public IScriptingEngine {
public:
    ComScriptingEngine(ApartmentPtr apartment, Dispatch application)
        : apartment_(std::move(apartment)), application_(std::move(application)) {}

    Result<size_t, Error> ConnectionCount() override {
        return ChildCount(application_, "GuiApplication");
    }

    Result<GuiConnectionPtr, Error> Connection(size_t index) override {
        auto connection = ChildAt(application_, index, "GuiApplication");
        if (connection.IsErr()) {
            return Result<GuiConnectionPtr, Error>::Err(std::move(connection).Error());
        }
        return Result<GuiConnectionPtr, Error>::Ok(std::make_shared<ComGuiConnection>(
            apartment_, std::move(connection).Value()));
    }

    Result<GuiConnectionPtr, Error> OpenConnection(std::string_view description,
                                                   bool synchronous) override {
        const std::string target(description);
        _variant_t value;
        auto called = InvokeMember(application_, L"OpenConnection", DISPATCH_METHOD,
                                   {TextArg(description), _variant_t(synchronous)},
                                   &value, target);
        if (called.IsErr()) {
            return Result<GuiConnectionPtr, Error>::Err(std::move(called).Error());
        }
        auto connection = TakeDispatch(value, "OpenConnection", target);
        if (connection.IsErr()) {
            return Result<GuiConnectionPtr, Error>::Err(std::move(connection).Error());
        }
        return Result<GuiConnectionPtr, Error>::Ok(std::make_shared<ComGuiConnection>(
            apartment_, std::move(connection).Value()));
    }

private:
    ApartmentPtr apartment_;
    Dispatch application_;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// ComEngineLocator
// ---------------------------------------------------------------------------
struct ComEngineLocator::Impl {
    ApartmentPtr apartment = std::make_shared<ComApartment>();
};

ComEngineLocator::ComEngineLocator() : impl_(std::make_unique<Impl>()) {}

ComEngineLocator::~ComEngineLocator() = default;

Result<ScriptingEnginePtr, Error> ComEngineLocator::Attach() {
    constexpr const char* kOperation = "AttachSapGui";

    CLSID clsid;
    HRESULT hr = CLSIDFromProgID(L"SapROTWr.SapROTWrapper", &clsid);
    if (FAILED(hr)) {
        return Result<ScriptingEnginePtr, Error>::Err(MakeComError(
            kOperation, "SapROTWr.SapROTWrapper",
            "SAP GUI ROT wrapper is not registered (" + HresultText(hr) +
                ") - is SAP GUI installed?"));
    }

    Dispatch wrapper;
    hr = CoCreateInstance(clsid, nullptr, CLSCTX_ALL,
                          IID_PPV_ARGS(wrapper.GetAddressOf()));
    if (FAILED(hr) || !wrapper) {
        return Result<ScriptingEnginePtr, Error>::Err(MakeComError(
            kOperation, "SapROTWr.SapROTWrapper",
            "cannot create ROT wrapper (" + HresultText(hr) + ")"));
    }

    _variant_t entry_value;
    auto entry_call = InvokeMember(wrapper, L"GetROTEntry", DISPATCH_METHOD,
                                   {TextArg("SAPGUI")}, &entry_value, "SAPGUI");
    if (entry_call.IsErr()) {
        auto error = std::move(entry_call).Error();
        error.operation = kOperation;
        return Result<ScriptingEnginePtr, Error>::Err(std::move(error));
    }
    auto entry = TakeDispatch(entry_value, "GetROTEntry", "SAPGUI");
    if (entry.IsErr()) {
        return Result<ScriptingEnginePtr, Error>::Err(MakeComError(
            kOperation, "SAPGUI", "SAP Logon is not running"));
    }

    auto application = GetObjectProperty(entry.Value(), L"GetScriptingEngine", "SAPGUI");
    if (application.IsErr()) {
        auto error = std::move(application).Error();
        error.operation = kOperation;
        error.hint = "Enable scripting: SAP GUI Options > Accessibility & Scripting > "
                     "Scripting > Enable scripting";
        return Result<ScriptingEnginePtr, Error>::Err(std::move(error));
    }

    LogDebug("engine", "attached to SAP GUI scripting engine");
    return Result<ScriptingEnginePtr, Error>::Ok(std::make_shared<ComScriptingEngine>(
        impl_->apartment, std::move(application).Value()));
}

} // namespace erpl_gui
