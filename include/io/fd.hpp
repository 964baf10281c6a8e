#pragma once

#include "util/result.hpp"

#include <string>

namespace corpus {

// Owning file descriptor. Descriptors opened through Open are close-on-exec
// so neither worker processes nor the verifier inherit them.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // Invalid on failure; errno is left as open(2) set it.
    static Fd Open(const std::string& path, int flags, int mode = 0644);

    int Get() const;
    bool Valid() const;

    Result Sync() const;

    void Reset(int fd);
    int Release();
    void Close();

  private:
    int fd_{-1};
};

} // namespace corpus
