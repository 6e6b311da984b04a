#include "pch.h"
#include "Math/Vector3D.hpp"

Vector3D Vector3D::operator+(const Vector3D& rhs) const {
    return Vector3D(x + rhs.x, y + rhs.y, z + rhs.z);
}

Vector3D Vector3D::operator-(const Vector3D& rhs) const {
    return Vector3D(x - rhs.x, y - rhs.y, z - rhs.z);
}

Vector3D Vector3D::operator*(float s) const {
    return Vector3D(x * s, y * s, z * s);
}

float Vector3D::LengthSquared() const {
    return x * x + y * y + z * z;
}

float Vector3D::Length() const {
    return std::sqrt(LengthSquared());
}

Vector3D Vector3D::Normalized() const {
    float len = Length();
    if (len <= 0.0f) {
        return Vector3D();
    }
    return Vector3D(x / len, y / len, z / len);
}

float Vector3D::Distance(const Vector3D& a, const Vector3D& b) {
    return (a - b).Length();
}
