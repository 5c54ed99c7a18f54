#include "mxr/resources/model_loader_assimp.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <unordered_map>
#include <vector>

#include <assimp/Importer.hpp>
#include <assimp/material.h>
#include <assimp/postprocess.h>
#include <assimp/scene.h>
#include <glm/gtc/type_ptr.hpp>

#include "mxr/core/log.hpp"
#include "mxr/resources/mesh.hpp"
#include "mxr/resources/skeleton.hpp"
#include "mxr/resources/texture_loader_sdl.hpp"

namespace mxr
{
    namespace
    {
        // Assimp matrices are row-major.
        glm::mat4 to_glm(const aiMatrix4x4& m)
        {
            return glm::transpose(glm::make_mat4(&m.a1));
        }

        glm::mat4 node_global_matrix(const aiNode* node)
        {
            glm::mat4 out(1.0f);
            for (const aiNode* n = node; n; n = n->mParent)
            {
                out = to_glm(n->mTransformation) * out;
            }
            return out;
        }

        RHIAddressMode address_mode(aiTextureMapMode m)
        {
            switch (m)
            {
                case aiTextureMapMode_Clamp:
                case aiTextureMapMode_Decal: return RHIAddressMode::ClampToEdge;
                case aiTextureMapMode_Mirror: return RHIAddressMode::MirroredRepeat;
                default: return RHIAddressMode::Repeat;
            }
        }

        // Uncompressed embedded textures are BGRA texels, top row first.
        TextureData texture_from_embedded(const aiTexture* tex, const std::string& label)
        {
            if (tex->mHeight == 0)
            {
                return load_texture_sdl_image_memory(tex->pcData, (size_t)tex->mWidth, label);
            }
            TextureData out((int)tex->mWidth, (int)tex->mHeight);
            out.source_path = label;
            for (size_t i = 0; i < out.texels.size(); ++i)
            {
                const aiTexel& t = tex->pcData[i];
                out.texels[i] = glm::u8vec4(t.r, t.g, t.b, t.a);
            }
            return out;
        }

        void convert_material_factors(const aiMaterial* src, Material& mat)
        {
            aiString name{};
            if (src->Get(AI_MATKEY_NAME, name) == AI_SUCCESS) mat.name = name.C_Str();

            PbrParams p = std::get<PbrParams>(mat.params);
            aiColor4D color{};
            if (src->Get(AI_MATKEY_BASE_COLOR, color) == AI_SUCCESS ||
                src->Get(AI_MATKEY_COLOR_DIFFUSE, color) == AI_SUCCESS)
            {
                p.base_color_factor = glm::vec4(color.r, color.g, color.b, color.a);
            }

            float opacity = 1.0f;
            if (src->Get(AI_MATKEY_OPACITY, opacity) == AI_SUCCESS)
            {
                p.base_color_factor.a *= opacity;
            }

            float metallic = 0.0f;
            if (src->Get(AI_MATKEY_METALLIC_FACTOR, metallic) == AI_SUCCESS) p.metallic_factor = metallic;

            float roughness = 0.5f;
            if (src->Get(AI_MATKEY_ROUGHNESS_FACTOR, roughness) == AI_SUCCESS) p.roughness_factor = roughness;

            aiColor3D emissive{};
            if (src->Get(AI_MATKEY_COLOR_EMISSIVE, emissive) == AI_SUCCESS)
            {
                p.emissive_color = glm::vec3(emissive.r, emissive.g, emissive.b);
            }
            float emissive_strength = 1.0f;
            if (src->Get(AI_MATKEY_EMISSIVE_INTENSITY, emissive_strength) == AI_SUCCESS)
            {
                p.emissive_strength = emissive_strength;
            }

            int two_sided = 0;
            if (src->Get(AI_MATKEY_TWOSIDED, two_sided) == AI_SUCCESS) mat.double_sided = two_sided != 0;

            if (p.base_color_factor.a < 1.0f) mat.blend_mode = RHIBlendMode::SourceOverPremultiplied;

            mat.params = p;
        }

        std::vector<uint32_t> triangle_indices(const aiMesh* m)
        {
            std::vector<uint32_t> indices{};
            indices.reserve((size_t)m->mNumFaces * 3u);
            for (unsigned int fi = 0; fi < m->mNumFaces; ++fi)
            {
                const aiFace& face = m->mFaces[fi];
                if (face.mNumIndices != 3) continue;
                indices.push_back((uint32_t)face.mIndices[0]);
                indices.push_back((uint32_t)face.mIndices[1]);
                indices.push_back((uint32_t)face.mIndices[2]);
            }
            return indices;
        }

        glm::vec3 vertex_normal(const aiMesh* m, unsigned int vi)
        {
            if (!m->HasNormals()) return glm::vec3(0.0f, 1.0f, 0.0f);
            const aiVector3D n = m->mNormals[vi];
            return glm::vec3(n.x, n.y, n.z);
        }

        glm::vec2 vertex_uv(const aiMesh* m, unsigned int vi)
        {
            if (!m->HasTextureCoords(0)) return glm::vec2(0.0f);
            const aiVector3D uv = m->mTextureCoords[0][vi];
            return glm::vec2(uv.x, uv.y);
        }

        std::shared_ptr<Mesh> build_static_mesh(IGpuDevice& device, const aiMesh* m, const std::string& label)
        {
            std::vector<glm::vec3> positions{};
            std::vector<glm::vec3> normals{};
            std::vector<glm::vec2> uvs{};
            positions.reserve(m->mNumVertices);
            normals.reserve(m->mNumVertices);
            uvs.reserve(m->mNumVertices);
            for (unsigned int vi = 0; vi < m->mNumVertices; ++vi)
            {
                const aiVector3D p = m->mVertices[vi];
                positions.push_back(glm::vec3(p.x, p.y, p.z));
                normals.push_back(vertex_normal(m, vi));
                uvs.push_back(vertex_uv(m, vi));
            }
            return Mesh::from_vertex_data(device, positions, normals, uvs, triangle_indices(m), label);
        }

        // Keeps the four strongest influences per vertex and renormalizes them.
        std::vector<SkinnedVertex> build_skinned_vertices(const aiMesh* m)
        {
            struct Influence
            {
                uint16_t joint = 0;
                float weight = 0.0f;
            };
            std::vector<std::vector<Influence>> influences(m->mNumVertices);
            for (unsigned int bi = 0; bi < m->mNumBones; ++bi)
            {
                const aiBone* bone = m->mBones[bi];
                for (unsigned int wi = 0; wi < bone->mNumWeights; ++wi)
                {
                    const aiVertexWeight& w = bone->mWeights[wi];
                    if (w.mVertexId >= m->mNumVertices || w.mWeight <= 0.0f) continue;
                    influences[w.mVertexId].push_back(Influence{(uint16_t)bi, w.mWeight});
                }
            }

            std::vector<SkinnedVertex> vertices(m->mNumVertices);
            for (unsigned int vi = 0; vi < m->mNumVertices; ++vi)
            {
                SkinnedVertex& v = vertices[vi];
                const aiVector3D p = m->mVertices[vi];
                v.position = glm::vec3(p.x, p.y, p.z);
                v.normal = vertex_normal(m, vi);
                v.uv = vertex_uv(m, vi);

                std::vector<Influence>& inf = influences[vi];
                std::sort(inf.begin(), inf.end(), [](const Influence& a, const Influence& b) { return a.weight > b.weight; });
                if (inf.size() > 4) inf.resize(4);

                float total = 0.0f;
                for (const Influence& i : inf) total += i.weight;
                if (total <= 0.0f) continue;

                v.joint_weights = glm::vec4(0.0f);
                for (size_t k = 0; k < inf.size(); ++k)
                {
                    v.joint_indices[k] = inf[k].joint;
                    v.joint_weights[(glm::length_t)k] = inf[k].weight / total;
                }
            }
            return vertices;
        }

        std::shared_ptr<Skeleton> build_skeleton(const aiScene* scene, const aiMesh* m, const aiNode* mesh_node)
        {
            auto skeleton = std::make_shared<Skeleton>();
            skeleton->name = m->mName.C_Str();
            const glm::mat4 mesh_from_world = glm::inverse(node_global_matrix(mesh_node));
            for (unsigned int bi = 0; bi < m->mNumBones; ++bi)
            {
                const aiBone* bone = m->mBones[bi];
                skeleton->joint_paths.push_back(bone->mName.C_Str());
                skeleton->inverse_bind_transforms.push_back(to_glm(bone->mOffsetMatrix));

                const aiNode* bone_node = scene->mRootNode->FindNode(bone->mName);
                if (bone_node)
                {
                    skeleton->rest_transforms.push_back(mesh_from_world * node_global_matrix(bone_node));
                }
                else
                {
                    // No node: rest pose is the bind pose.
                    skeleton->rest_transforms.push_back(glm::inverse(to_glm(bone->mOffsetMatrix)));
                }
            }
            return skeleton;
        }

        class SubtreeBuilder
        {
        public:
            SubtreeBuilder(IGpuDevice& device, EntityGraph& graph, const aiScene* scene, const std::string& path)
                : device_(device)
                , graph_(graph)
                , scene_(scene)
                , path_(path)
                , directory_(std::filesystem::path(path).parent_path())
            {
            }

            EntityId build(const aiNode* node)
            {
                const EntityId id = graph_.create(node->mName.C_Str(), Transform(to_glm(node->mTransformation)));
                created_.push_back(id);

                for (unsigned int i = 0; i < node->mNumMeshes; ++i)
                {
                    const unsigned int mesh_index = node->mMeshes[i];
                    if (mesh_index >= scene_->mNumMeshes) continue;
                    const EntityId mesh_entity = build_mesh_entity(scene_->mMeshes[mesh_index], node);
                    if (mesh_entity.valid()) graph_.add_child(id, mesh_entity);
                }

                for (unsigned int i = 0; i < node->mNumChildren; ++i)
                {
                    graph_.add_child(id, build(node->mChildren[i]));
                }
                return id;
            }

            // Frees whatever a failed build left behind.
            void discard()
            {
                for (const EntityId id : created_)
                {
                    if (graph_.alive(id)) graph_.destroy(id);
                }
                created_.clear();
            }

        private:
            std::shared_ptr<Material> material_at(unsigned int index)
            {
                auto it = materials_.find(index);
                if (it != materials_.end()) return it->second;
                const aiMaterial* src = index < scene_->mNumMaterials ? scene_->mMaterials[index] : nullptr;
                auto mat = Material::make_default_pbr();
                if (src)
                {
                    convert_material_factors(src, *mat);
                    PbrParams p = std::get<PbrParams>(mat->params);
                    p.base_color_texture = texture_slot(src, aiTextureType_BASE_COLOR, TextureContent::Color);
                    if (!p.base_color_texture) p.base_color_texture = texture_slot(src, aiTextureType_DIFFUSE, TextureContent::Color);
                    p.normal_texture = texture_slot(src, aiTextureType_NORMALS, TextureContent::Data);
                    p.metalness_texture = texture_slot(src, aiTextureType_METALNESS, TextureContent::Data);
                    p.roughness_texture = texture_slot(src, aiTextureType_DIFFUSE_ROUGHNESS, TextureContent::Data);
                    p.emissive_texture = texture_slot(src, aiTextureType_EMISSIVE, TextureContent::Color);
                    mat->params = p;
                }
                materials_.emplace(index, mat);
                return mat;
            }

            // First texture of `type`; an unreadable file leaves the slot empty.
            TextureResource texture_slot(const aiMaterial* src, aiTextureType type, TextureContent content)
            {
                if (src->GetTextureCount(type) == 0) return TextureResource{};

                aiString path{};
                aiTextureMapMode modes[3] = {aiTextureMapMode_Wrap, aiTextureMapMode_Wrap, aiTextureMapMode_Wrap};
                if (src->GetTexture(type, 0, &path, nullptr, nullptr, nullptr, nullptr, modes) != AI_SUCCESS)
                {
                    return TextureResource{};
                }

                TextureResource out{};
                out.image = image_for(path.C_Str(), content);
                if (!out.image) return TextureResource{};

                RHISamplerDesc sd{};
                sd.address_u = address_mode(modes[0]);
                sd.address_v = address_mode(modes[1]);
                if (!(sd == RHISamplerDesc{})) out.sampler = sampler_for(sd);
                return out;
            }

            std::shared_ptr<IGpuImage> image_for(const std::string& ref, TextureContent content)
            {
                const std::string key = ref + (content == TextureContent::Color ? "#color" : "#data");
                auto it = images_.find(key);
                if (it != images_.end()) return it->second;

                TextureData data{};
                if (const aiTexture* embedded = scene_->GetEmbeddedTexture(ref.c_str()))
                {
                    data = texture_from_embedded(embedded, path_ + ":" + ref);
                }
                else
                {
                    data = load_texture_sdl_image((directory_ / ref).string());
                }

                std::shared_ptr<IGpuImage> image{};
                if (data.valid())
                {
                    image = upload_texture(device_, data, content, path_ + ":" + ref);
                }
                else
                {
                    log_warn("load_model_assimp: texture '" + ref + "' of '" + path_ + "' not loaded");
                }
                images_.emplace(key, image);
                return image;
            }

            std::shared_ptr<ISamplerState> sampler_for(const RHISamplerDesc& desc)
            {
                for (const auto& s : samplers_)
                {
                    if (s->desc() == desc) return s;
                }
                auto sampler = device_.create_sampler_state(desc);
                if (!sampler) throw GpuResourceError(ResourceError::AllocationFailure, "texture sampler");
                samplers_.push_back(sampler);
                return sampler;
            }

            EntityId build_mesh_entity(const aiMesh* m, const aiNode* owner)
            {
                if (!m || m->mNumVertices == 0) return kNullEntity;

                const std::string name = m->mName.length > 0 ? std::string(m->mName.C_Str()) : std::string("Mesh");
                const std::string label = path_ + ":" + name;
                const std::shared_ptr<Material> material = material_at(m->mMaterialIndex);

                const EntityId id = graph_.create(name);
                created_.push_back(id);
                EntityNode& node = graph_.node(id);

                if (!m->HasBones())
                {
                    auto mesh = build_static_mesh(device_, m, label);
                    mesh->materials = {material};
                    node.mesh = mesh;
                    return id;
                }

                if (m->mNumBones > 0xffffu)
                {
                    log_warn("load_model_assimp: mesh '" + name + "' has too many bones, importing it unskinned");
                    auto mesh = build_static_mesh(device_, m, label);
                    mesh->materials = {material};
                    node.mesh = mesh;
                    return id;
                }

                auto base = Mesh::from_skinned_vertices(device_, build_skinned_vertices(m), triangle_indices(m), label);
                base->materials = {material};
                node.mesh = base->copy_for_skinning(device_);
                node.skinner = std::make_shared<Skinner>(build_skeleton(scene_, m, owner), base);
                return id;
            }

            IGpuDevice& device_;
            EntityGraph& graph_;
            const aiScene* scene_ = nullptr;
            std::string path_{};
            std::filesystem::path directory_{};
            std::unordered_map<unsigned int, std::shared_ptr<Material>> materials_{};
            std::unordered_map<std::string, std::shared_ptr<IGpuImage>> images_{};
            std::vector<std::shared_ptr<ISamplerState>> samplers_{};
            std::vector<EntityId> created_{};
        };
    }

    unsigned int to_assimp_flags(const ModelLoadOptions& opt)
    {
        unsigned int flags = 0;
        if (opt.triangulate) flags |= aiProcess_Triangulate;
        if (opt.generate_normals) flags |= aiProcess_GenSmoothNormals;
        if (opt.join_identical_vertices) flags |= aiProcess_JoinIdenticalVertices;
        if (opt.flip_uvs) flags |= aiProcess_FlipUVs;
        if (opt.limit_bone_weights) flags |= aiProcess_LimitBoneWeights;
        return flags;
    }

    Result<EntityId> load_model_assimp(
        IGpuDevice& device,
        EntityGraph& graph,
        const std::string& path,
        const ModelLoadOptions& opt)
    {
        Assimp::Importer importer;
        const aiScene* scene = importer.ReadFile(path.c_str(), to_assimp_flags(opt));
        if (!scene || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) || !scene->mRootNode)
        {
            return Result<EntityId>::failure("load_model_assimp: '" + path + "': " + importer.GetErrorString());
        }

        SubtreeBuilder builder(device, graph, scene, path);
        try
        {
            const EntityId root = builder.build(scene->mRootNode);
            log_info("Loaded model '" + path + "' (" + std::to_string(scene->mNumMeshes) + " meshes)");
            return Result<EntityId>::success(root);
        }
        catch (const GpuResourceError& e)
        {
            builder.discard();
            return Result<EntityId>::failure("load_model_assimp: '" + path + "': " + e.what());
        }
    }
}
