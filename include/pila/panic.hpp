/**
 * @file panic.hpp
 * @brief pila VM panic handler C++ wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "pila/panic.h"

namespace pila
{

/**
 * @brief C++ alias for PilaPanicInfo
 */
using PanicInfo = PilaPanicInfo;

/**
 * @brief C++ alias for PilaPanicHandler
 */
using PanicHandler = PilaPanicHandler;

/**
 * @brief Set panic handler (C++ wrapper)
 *
 * @param vm         VM instance
 * @param handler    Panic handler callback
 * @param user_data  User data passed to handler
 */
inline void set_panic_handler(Vm *vm, PanicHandler handler, void *user_data = nullptr)
{
  vm_set_panic_handler(vm, handler, user_data);
}

}  // namespace pila
