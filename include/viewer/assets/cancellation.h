#pragma once

#include <memory>

namespace CVW {
namespace Assets {

// Shared flag between the owner of a piece of work and the work itself.
// Checked before every state write and every new network call.
class CancelToken {
public:
    CancelToken() = default;

    bool isCancelled() const { return m_flag && *m_flag; }

private:
    friend class CancelSource;
    explicit CancelToken(std::shared_ptr<bool> flag) : m_flag(std::move(flag)) {}

    std::shared_ptr<bool> m_flag;
};

class CancelSource {
public:
    CancelSource() : m_flag(std::make_shared<bool>(false)) {}

    CancelToken token() const { return CancelToken(m_flag); }
    void cancel() { *m_flag = true; }
    bool isCancelled() const { return *m_flag; }

private:
    std::shared_ptr<bool> m_flag;
};

} // namespace Assets
} // namespace CVW
