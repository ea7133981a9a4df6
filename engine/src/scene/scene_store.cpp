#include <glint/scene/scene_store.h>
#include <glint/core/log.h>

#include <cmath>
#include <string>

namespace glint
{

// --- Validation ---

static bool isFinite(const glm::vec3& v)
{
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

static bool isUnitColor(const glm::vec3& c)
{
    return isFinite(c) &&
           c.r >= 0.0f && c.r <= 1.0f &&
           c.g >= 0.0f && c.g <= 1.0f &&
           c.b >= 0.0f && c.b <= 1.0f;
}

template <typename T>
static bool validateCommon(const T& p, const char* name)
{
    if (!isFinite(p.center))
    {
        Log::error(std::string(name) + ": center must be finite");
        return false;
    }
    if (!isUnitColor(p.color))
    {
        Log::error(std::string(name) + ": color components must be in [0, 1]");
        return false;
    }
    if (static_cast<uint32_t>(p.blendMode) >= static_cast<uint32_t>(BLEND_MODE_COUNT))
    {
        Log::error(std::string(name) + ": unknown blend mode "
                   + std::to_string(static_cast<uint32_t>(p.blendMode)));
        return false;
    }
    if (!std::isfinite(p.blendStrength) || p.blendStrength <= 0.0f)
    {
        Log::error(std::string(name) + ": blend strength must be > 0");
        return false;
    }
    return true;
}

bool SceneStore::validate(const Sphere& sphere)
{
    if (!validateCommon(sphere, "Sphere"))
        return false;
    if (!std::isfinite(sphere.radius) || sphere.radius <= 0.0f)
    {
        Log::error("Sphere: radius must be > 0");
        return false;
    }
    return true;
}

bool SceneStore::validate(const Box& box)
{
    if (!validateCommon(box, "Box"))
        return false;
    const glm::vec3& b = box.halfExtents;
    if (!isFinite(b) || b.x <= 0.0f || b.y <= 0.0f || b.z <= 0.0f)
    {
        Log::error("Box: half extents must be > 0");
        return false;
    }
    return true;
}

bool SceneStore::validate(const Torus& torus)
{
    if (!validateCommon(torus, "Torus"))
        return false;
    if (!std::isfinite(torus.majorRadius) || !std::isfinite(torus.minorRadius) ||
        torus.majorRadius <= 0.0f || torus.minorRadius <= 0.0f)
    {
        Log::error("Torus: radii must be > 0");
        return false;
    }
    if (torus.minorRadius >= torus.majorRadius)
    {
        Log::error("Torus: minor radius must be smaller than major radius");
        return false;
    }
    return true;
}

// --- Storage ---

template <typename T>
int SceneStore::append(std::vector<T>& list, const T& value, PrimitiveType type)
{
    if (static_cast<int>(list.size()) >= PRIMITIVE_CAPACITY)
    {
        Log::warn(std::string(toString(type)) + " capacity reached ("
                  + std::to_string(PRIMITIVE_CAPACITY) + ")");
        return -1;
    }
    if (!validate(value))
        return -1;

    list.push_back(value);
    ++m_revision;
    return static_cast<int>(list.size()) - 1;
}

template <typename T>
bool SceneStore::replace(std::vector<T>& list, int index, const T& value, PrimitiveType type)
{
    if (!checkSlot(type, index))
        return false;
    if (!validate(value))
        return false;

    list[static_cast<size_t>(index)] = value;
    ++m_revision;
    return true;
}

bool SceneStore::checkSlot(PrimitiveType type, int index) const
{
    if (index < 0 || index >= count(type))
    {
        Log::error(std::string(toString(type)) + " slot " + std::to_string(index)
                   + " is not active (count " + std::to_string(count(type)) + ")");
        return false;
    }
    return true;
}

int SceneStore::addPrimitive(PrimitiveType type)
{
    int slot = count(type);
    float x = static_cast<float>(slot % 5) * 1.2f - 2.4f;
    float y = static_cast<float>(slot / 5) * 1.2f;

    switch (type)
    {
        case PrimitiveType::Sphere:
        {
            Sphere s;
            s.center = { x, y, 0.0f };
            return addSphere(s);
        }
        case PrimitiveType::Box:
        {
            Box b;
            b.center = { x, y, -1.5f };
            return addBox(b);
        }
        case PrimitiveType::Torus:
        {
            Torus t;
            t.center = { x, y, 1.5f };
            return addTorus(t);
        }
    }
    Log::error("addPrimitive: unknown primitive type");
    return -1;
}

int SceneStore::addSphere(const Sphere& sphere)
{
    return append(m_spheres, sphere, PrimitiveType::Sphere);
}

int SceneStore::addBox(const Box& box)
{
    return append(m_boxes, box, PrimitiveType::Box);
}

int SceneStore::addTorus(const Torus& torus)
{
    return append(m_tori, torus, PrimitiveType::Torus);
}

bool SceneStore::updateSphere(int index, const Sphere& sphere)
{
    return replace(m_spheres, index, sphere, PrimitiveType::Sphere);
}

bool SceneStore::updateBox(int index, const Box& box)
{
    return replace(m_boxes, index, box, PrimitiveType::Box);
}

bool SceneStore::updateTorus(int index, const Torus& torus)
{
    return replace(m_tori, index, torus, PrimitiveType::Torus);
}

bool SceneStore::removePrimitive(PrimitiveType type, int index)
{
    if (!checkSlot(type, index))
        return false;

    // erase() shifts later slots down, keeping the active prefix contiguous
    switch (type)
    {
        case PrimitiveType::Sphere: m_spheres.erase(m_spheres.begin() + index); break;
        case PrimitiveType::Box:    m_boxes.erase(m_boxes.begin() + index);     break;
        case PrimitiveType::Torus:  m_tori.erase(m_tori.begin() + index);       break;
    }
    ++m_revision;
    return true;
}

// --- Field access ---

template <typename T>
static bool writeCommon(T& p, PrimitiveParam param, float value)
{
    switch (param)
    {
        case PrimitiveParam::CenterX: p.center.x = value; return true;
        case PrimitiveParam::CenterY: p.center.y = value; return true;
        case PrimitiveParam::CenterZ: p.center.z = value; return true;
        case PrimitiveParam::ColorR:  p.color.r = value;  return true;
        case PrimitiveParam::ColorG:  p.color.g = value;  return true;
        case PrimitiveParam::ColorB:  p.color.b = value;  return true;
        case PrimitiveParam::BlendStrength: p.blendStrength = value; return true;
        case PrimitiveParam::BlendMode:
        {
            if (!std::isfinite(value) || value != std::floor(value))
                return false;
            auto mode = blendModeFromIndex(static_cast<int>(value));
            if (!mode)
                return false;
            p.blendMode = *mode;
            return true;
        }
        default:
            return false;
    }
}

template <typename T>
static std::optional<float> readCommon(const T& p, PrimitiveParam param)
{
    switch (param)
    {
        case PrimitiveParam::CenterX: return p.center.x;
        case PrimitiveParam::CenterY: return p.center.y;
        case PrimitiveParam::CenterZ: return p.center.z;
        case PrimitiveParam::ColorR:  return p.color.r;
        case PrimitiveParam::ColorG:  return p.color.g;
        case PrimitiveParam::ColorB:  return p.color.b;
        case PrimitiveParam::BlendStrength: return p.blendStrength;
        case PrimitiveParam::BlendMode: return static_cast<float>(static_cast<uint32_t>(p.blendMode));
        default: return std::nullopt;
    }
}

static bool writeField(Sphere& s, PrimitiveParam param, float value)
{
    if (param == PrimitiveParam::Radius) { s.radius = value; return true; }
    return writeCommon(s, param, value);
}

static bool writeField(Box& b, PrimitiveParam param, float value)
{
    switch (param)
    {
        case PrimitiveParam::HalfExtentX: b.halfExtents.x = value; return true;
        case PrimitiveParam::HalfExtentY: b.halfExtents.y = value; return true;
        case PrimitiveParam::HalfExtentZ: b.halfExtents.z = value; return true;
        default: return writeCommon(b, param, value);
    }
}

static bool writeField(Torus& t, PrimitiveParam param, float value)
{
    switch (param)
    {
        case PrimitiveParam::MajorRadius: t.majorRadius = value; return true;
        case PrimitiveParam::MinorRadius: t.minorRadius = value; return true;
        default: return writeCommon(t, param, value);
    }
}

static std::optional<float> readField(const Sphere& s, PrimitiveParam param)
{
    if (param == PrimitiveParam::Radius) return s.radius;
    return readCommon(s, param);
}

static std::optional<float> readField(const Box& b, PrimitiveParam param)
{
    switch (param)
    {
        case PrimitiveParam::HalfExtentX: return b.halfExtents.x;
        case PrimitiveParam::HalfExtentY: return b.halfExtents.y;
        case PrimitiveParam::HalfExtentZ: return b.halfExtents.z;
        default: return readCommon(b, param);
    }
}

static std::optional<float> readField(const Torus& t, PrimitiveParam param)
{
    switch (param)
    {
        case PrimitiveParam::MajorRadius: return t.majorRadius;
        case PrimitiveParam::MinorRadius: return t.minorRadius;
        default: return readCommon(t, param);
    }
}

bool SceneStore::setParam(PrimitiveType type, int index, PrimitiveParam param, float value)
{
    if (!checkSlot(type, index))
        return false;

    if (!appliesTo(param, type))
    {
        Log::error(std::string(toString(type)) + " has no field " + toString(param));
        return false;
    }

    // Edit a copy so a rejected value leaves the stored record untouched
    auto apply = [&](auto& list) -> bool
    {
        auto copy = list[static_cast<size_t>(index)];
        if (!writeField(copy, param, value))
        {
            Log::error(std::string("Invalid value for ") + toString(param) + ": "
                       + std::to_string(value));
            return false;
        }
        return replace(list, index, copy, type);
    };

    switch (type)
    {
        case PrimitiveType::Sphere: return apply(m_spheres);
        case PrimitiveType::Box:    return apply(m_boxes);
        case PrimitiveType::Torus:  return apply(m_tori);
    }
    return false;
}

std::optional<float> SceneStore::getParam(PrimitiveType type, int index, PrimitiveParam param) const
{
    if (index < 0 || index >= count(type))
        return std::nullopt;

    auto i = static_cast<size_t>(index);
    switch (type)
    {
        case PrimitiveType::Sphere: return readField(m_spheres[i], param);
        case PrimitiveType::Box:    return readField(m_boxes[i], param);
        case PrimitiveType::Torus:  return readField(m_tori[i], param);
    }
    return std::nullopt;
}

bool SceneStore::setPosition(const PrimitiveRef& ref, const glm::vec3& position)
{
    if (!checkSlot(ref.type, ref.slot))
        return false;
    if (!isFinite(position))
    {
        Log::error("setPosition: position must be finite");
        return false;
    }

    auto i = static_cast<size_t>(ref.slot);
    switch (ref.type)
    {
        case PrimitiveType::Sphere: m_spheres[i].center = position; break;
        case PrimitiveType::Box:    m_boxes[i].center = position;   break;
        case PrimitiveType::Torus:  m_tori[i].center = position;    break;
    }
    ++m_revision;
    return true;
}

std::optional<glm::vec3> SceneStore::getPosition(const PrimitiveRef& ref) const
{
    if (!isValid(ref))
        return std::nullopt;

    auto i = static_cast<size_t>(ref.slot);
    switch (ref.type)
    {
        case PrimitiveType::Sphere: return m_spheres[i].center;
        case PrimitiveType::Box:    return m_boxes[i].center;
        case PrimitiveType::Torus:  return m_tori[i].center;
    }
    return std::nullopt;
}

std::optional<glm::vec3> SceneStore::getColor(const PrimitiveRef& ref) const
{
    if (!isValid(ref))
        return std::nullopt;

    auto i = static_cast<size_t>(ref.slot);
    switch (ref.type)
    {
        case PrimitiveType::Sphere: return m_spheres[i].color;
        case PrimitiveType::Box:    return m_boxes[i].color;
        case PrimitiveType::Torus:  return m_tori[i].color;
    }
    return std::nullopt;
}

bool SceneStore::isValid(const PrimitiveRef& ref) const
{
    return ref.slot >= 0 && ref.slot < count(ref.type);
}

int SceneStore::count(PrimitiveType type) const
{
    switch (type)
    {
        case PrimitiveType::Sphere: return static_cast<int>(m_spheres.size());
        case PrimitiveType::Box:    return static_cast<int>(m_boxes.size());
        case PrimitiveType::Torus:  return static_cast<int>(m_tori.size());
    }
    return 0;
}

int SceneStore::totalCount() const
{
    return static_cast<int>(m_spheres.size() + m_boxes.size() + m_tori.size());
}

void SceneStore::clear()
{
    m_spheres.clear();
    m_boxes.clear();
    m_tori.clear();
    ++m_revision;
}

} // namespace glint
