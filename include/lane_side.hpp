#pragma once

enum class LaneSide { Left, Right };
