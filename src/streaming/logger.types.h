#pragma once

typedef enum
{
    LogLevel_Debug,
    LogLevel_Info,
    LogLevel_Warning,
    LogLevel_Error,
    LogLevel_None,
} LogLevel;
