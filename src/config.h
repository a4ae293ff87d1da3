///
/// cerexx - Configuration and Cross Platform macros
///
#ifndef __CEREXX_SRC_CONFIG_H
#define __CEREXX_SRC_CONFIG_H
#include <cstdint>
#include <cstdio>
///
///@name Conditional compililation options
///@{
#define CC_DEBUG        1               /**< debug level 0|1|2           */
#define RX_DIGITS       9               /**< default NUMERIC DIGITS      */
#define RX_FUZZ         0               /**< default NUMERIC FUZZ        */
#define RX_MAX_DIGITS   15              /**< digits carried by a double  */
#define RX_TIMEOUT_MS   30000           /**< default checkpoint timeout  */
#define RX_MAX_DEPTH    250             /**< max nested routine calls    */
#define RX_PATH_ENV     "CEREXX_PATH"   /**< module search path env var  */
#define RX_DETECT       "cerexx_detect" /**< module detection entry      */
#define RX_META         "cerexx_meta"   /**< optional entry name export  */
#define RX_VERSION      "cerexx 1.0"
///@}
///
///@name Logical units (instead of physical) for type check and portability
///@{
typedef uint64_t        U64;   ///< unsigned 64-bit integer
typedef int64_t         S64;   ///< signed 64-bit integer
typedef uint32_t        U32;   ///< unsigned 32-bit integer
typedef int32_t         S32;   ///< signed 32-bit integer
typedef uint16_t        U16;   ///< unsigned 16-bit integer
typedef uint8_t         U8;    ///< byte, unsigned character
typedef int8_t          S8;    ///< signed byte
///@}
///@name Platform support
///@{
#include <chrono>
#include <thread>
#define millis()        ((U64)std::chrono::duration_cast<std::chrono::milliseconds>( \
                        std::chrono::steady_clock::now().time_since_epoch()).count())
#define delay(ms)       std::this_thread::sleep_for(std::chrono::milliseconds(ms))
///@}
///@name Logging supporting macros
///@{
#if CC_DEBUG > 1
#if (_WIN32 || _WIN64)
#define RX_LOG(rx, fmt, ...)                   \
    printf("[%02d.%d] " fmt "\n",              \
           (rx)->id, (rx)->state, ##__VA_ARGS__)
#else // !(_WIN32 || _WIN64)
#define RX_LOG(rx, fmt, ...)                   \
    printf("\e[%dm[%02d.%d] " fmt "\e[0m\n",   \
           ((rx)->id&7) ? 38-((rx)->id&7) : 37, (rx)->id, (rx)->state, ##__VA_ARGS__)
#endif // (_WIN32 || _WIN64)

#else  // !(CC_DEBUG > 1)

#define RX_LOG(rx, fmt, ...)
#endif // CC_DEBUG > 1
///@}
#endif // __CEREXX_SRC_CONFIG_H
