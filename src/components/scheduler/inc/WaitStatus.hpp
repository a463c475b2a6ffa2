#pragma once

enum class WaitStatus {
    Ready,
    Cancelled
};
