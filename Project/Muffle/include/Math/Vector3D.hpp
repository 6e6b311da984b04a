#pragma once

#include "Muffle.h"

struct MUFFLE_API Vector3D {
    float x, y, z;

    Vector3D() : x(0.0f), y(0.0f), z(0.0f) {}
    Vector3D(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    Vector3D operator+(const Vector3D& rhs) const;
    Vector3D operator-(const Vector3D& rhs) const;
    Vector3D operator*(float s) const;

    float    Length() const;
    float    LengthSquared() const;

    // Zero-length vectors stay zero instead of dividing by zero
    Vector3D Normalized() const;

    static float Distance(const Vector3D& a, const Vector3D& b);
};
