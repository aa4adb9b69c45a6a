//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_READ_WRITE_LOCKED_HPP
#define LLBS_READ_WRITE_LOCKED_HPP

#include <llbs/config.hpp>
//

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace llbs {

/** \brief A value of type T guarded by a reader/writer lock.
 *
 * Access to the value is only possible through one of the two lock guard types:
 *
 *  - ReadWriteLocked<T>::Lock (from `lock()`) grants exclusive, mutable access
 *  - ReadWriteLocked<T>::SharedLock (from `lock_shared()`) grants shared, const access
 *
 * Example:
 *
 * \code
 * ReadWriteLocked<std::vector<u8>> data{512};
 * {
 *   auto locked = data.lock();
 *   locked->front() = 0xff;
 * }
 * {
 *   auto locked = data.lock_shared();
 *   std::cout << int(locked->front());
 * }
 * \endcode
 */
template <typename T>
class ReadWriteLocked
{
 public:
  using value_type = T;

  class Lock
  {
   public:
    explicit Lock(ReadWriteLocked& locked) : lock_{locked.mutex_}, value_{&locked.value_}
    {
    }

    T& operator*() const noexcept
    {
      return *this->value_;
    }

    T* operator->() const noexcept
    {
      return this->value_;
    }

   private:
    std::unique_lock<std::shared_mutex> lock_;
    T* value_;
  };

  class SharedLock
  {
   public:
    explicit SharedLock(const ReadWriteLocked& locked)
        : lock_{locked.mutex_}
        , value_{&locked.value_}
    {
    }

    const T& operator*() const noexcept
    {
      return *this->value_;
    }

    const T* operator->() const noexcept
    {
      return this->value_;
    }

   private:
    std::shared_lock<std::shared_mutex> lock_;
    const T* value_;
  };

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  template <typename... Args>
  explicit ReadWriteLocked(Args&&... args) noexcept(noexcept(T(std::forward<Args>(args)...)))
      : value_(std::forward<Args>(args)...)
  {
  }

  ReadWriteLocked(const ReadWriteLocked&) = delete;
  ReadWriteLocked& operator=(const ReadWriteLocked&) = delete;

  Lock lock()
  {
    return Lock{*this};
  }

  SharedLock lock_shared() const
  {
    return SharedLock{*this};
  }

 private:
  mutable std::shared_mutex mutex_;
  T value_;
};

}  // namespace llbs

#endif  // LLBS_READ_WRITE_LOCKED_HPP
