#pragma once
#include <inttypes.h>
#include <stdlib.h>
#include <esp_log.h>

#undef _
#define _(n) n 
enum class ErrorCode:int
{
#include "errorcodes.inc"
};

#undef _
#define _(n) #n 

constexpr const char* ErrorCodeStr[]{
    #include "errorcodes.inc"
};
#undef _

#define RETURN_ON_ERRORCODE(x)                                                                    \
    do                                                                                            \
    {                                                                                             \
        ErrorCode err_rc_ = (x);                                                                  \
        if (err_rc_ != ErrorCode::OK)                                                             \
        {                                                                                         \
            return err_rc_;                                                                       \
        }                                                                                         \
    } while (0)

#define RETURN_ERRORCODE_ON_FALSE(a, errorCode, format, ...)                         \
    do                                                                               \
    {                                                                                \
        if (!(a))                                                                    \
        {                                                                            \
            ESP_LOGE(TAG, "%s(%d): " format, __FUNCTION__, __LINE__, ##__VA_ARGS__); \
            return errorCode;                                                        \
        }                                                                            \
    } while (0)

#define ERRORCODE_CHECK(x)                                                                                            \
    do                                                                                                                \
    {                                                                                                                 \
        ErrorCode __err_rc = (x);                                                                                     \
        if (__err_rc != ErrorCode::OK)                                                                                \
        {                                                                                                             \
            ESP_LOGE(TAG, "Error %s occured in File %s in line %d in expression %s", ErrorCodeStr[(int)__err_rc], __FILE__, __LINE__, #x); \
            abort();\
        }                                                                                                             \
    } while (0)
