#pragma once
/*-----------------------------------------------------------------------------
 *  wallgraph.hpp
 *
 *  Planar graph of wall centerlines: junctions are nodes, wall pieces are
 *  undirected links. Bounded faces of the graph are the rooms of a storey.
 *---------------------------------------------------------------------------*/
#include <cstdint>
#include <map>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>

namespace cloud2bim {

/* ---------- forward declarations ------------------------------------------ */
class IJunctionNode;
class JunctionNode;
using JunctionId      = std::uint64_t;
using JunctionPtr     = std::shared_ptr<JunctionNode>;
using WeakJunctionPtr = std::weak_ptr<JunctionNode>;

/* ---------- link descriptor ----------------------------------------------- */
/**
 * @brief Wall piece between two junctions.
 */
struct WallLink
{
    WeakJunctionPtr neighbour;   ///< other end (weak to break cycles)
    int             wallId{0};   ///< wall the piece was cut from
};

/* ---------- node interface ------------------------------------------------ */
class IJunctionNode
{
public:
    virtual ~IJunctionNode() = default;

    virtual JunctionId                   id()       const noexcept = 0;
    virtual const cv::Point2d&           position() const noexcept = 0;
    virtual const std::vector<WallLink>& links()    const noexcept = 0;
};

/* ---------- graph interface ----------------------------------------------- */
class IWallGraph
{
public:
    virtual ~IWallGraph() = default;

    virtual JunctionPtr addNode(const cv::Point2d& position) = 0;

    /** Remove node and all links pointing to it. */
    virtual bool removeNode(JunctionId id) = 0;

    /** Undirected connection helpers. A second link between the same pair is ignored. */
    virtual bool connect   (JunctionId a, JunctionId b, int wallId) = 0;
    virtual bool disconnect(JunctionId a, JunctionId b) = 0;

    virtual JunctionPtr              getNode(JunctionId id) const = 0;
    virtual std::vector<JunctionPtr> allNodes()             const = 0;
};

/* ---------- concrete node ------------------------------------------------- */
class JunctionNode final : public IJunctionNode,
                           public std::enable_shared_from_this<JunctionNode>
{
public:
    JunctionNode(JunctionId id, cv::Point2d position);

    JunctionId                   id()       const noexcept override { return id_; }
    const cv::Point2d&           position() const noexcept override { return position_; }
    const std::vector<WallLink>& links()    const noexcept override { return links_; }

    [[nodiscard]] size_t degree() const noexcept { return links_.size(); }

    /* internal for WallGraph */
    bool addLink(const JunctionPtr& neighbour, int wallId);
    void removeLinkTo(const JunctionPtr& neighbour);

private:
    JunctionId            id_{0};
    cv::Point2d           position_{};
    std::vector<WallLink> links_;
};

/* ---------- concrete graph ------------------------------------------------ */
/**
 * @brief Wall graph with deterministic iteration order (ascending node id).
 */
class WallGraph final : public IWallGraph
{
public:
    JunctionPtr addNode(const cv::Point2d& position) override;
    bool        removeNode(JunctionId id) override;

    bool connect   (JunctionId a, JunctionId b, int wallId) override;
    bool disconnect(JunctionId a, JunctionId b) override;

    JunctionPtr              getNode(JunctionId id) const override;
    std::vector<JunctionPtr> allNodes()             const override;

    [[nodiscard]] size_t linkCount() const noexcept;

    /** Repeatedly drop nodes of degree 0 or 1. Returns the number removed. */
    size_t pruneDangling();

    /**
     * Walk every directed link once, turning at each node to the next link
     * clockwise from the one it arrived by. Bounded faces come out
     * counter-clockwise, the outer face of each component clockwise.
     */
    std::vector<std::vector<cv::Point2d>> traceFaces() const;

private:
    std::map<JunctionId, JunctionPtr> nodes_;
    JunctionId                        nextId_{1};
};

} // namespace cloud2bim
