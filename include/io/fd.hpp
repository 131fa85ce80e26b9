#pragma once

#include "util/result.hpp"

namespace tzupdater {

class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();
    void Close();

    // pipe2(O_CLOEXEC) into two owned descriptors.
    static Result MakePipe(Fd& read_end, Fd& write_end);

  private:
    int fd_{-1};
};

} // namespace tzupdater
